#include "audit/access_log_emitter.hpp"
#include "audit/file_sink.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"
#include "policy/policy_codec.hpp"

#include <format>

namespace rlsengine {

// ============================================================================
// Construction / Destruction
// ============================================================================

AccessLogEmitter::AccessLogEmitter(const AuditConfig& config)
    : queue_(config.queue_capacity),
      flush_interval_(config.batch_flush_interval),
      integrity_enabled_(config.integrity_enabled) {

    FileSink::Config file_cfg;
    file_cfg.output_file = config.output_file;
    file_cfg.max_file_size_bytes = config.rotation_max_file_size_mb * 1024ULL * 1024;
    file_cfg.max_files = config.rotation_max_files;
    file_cfg.rotation_interval = std::chrono::hours(config.rotation_interval_hours);
    file_cfg.time_based_rotation = config.rotation_time_based;
    file_cfg.size_based_rotation = config.rotation_size_based;
    sinks_.push_back(std::make_unique<FileSink>(file_cfg));

    start();
}

AccessLogEmitter::AccessLogEmitter(
    std::vector<std::unique_ptr<IAuditSink>> sinks,
    bool integrity_enabled,
    std::chrono::milliseconds flush_interval,
    size_t queue_capacity)
    : sinks_(std::move(sinks)),
      queue_(queue_capacity),
      flush_interval_(flush_interval),
      integrity_enabled_(integrity_enabled) {
    start();
}

AccessLogEmitter::~AccessLogEmitter() {
    shutdown();
}

void AccessLogEmitter::start() {
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AccessLogEmitter::writer_loop, this);
    for (const auto& sink : sinks_) {
        utils::log::info(std::format("Access log sink: {}", sink->name()));
    }
}

// ============================================================================
// Public Interface
// ============================================================================

void AccessLogEmitter::emit(AccessRecord record) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    record.sequence_num = sequence_counter_.fetch_add(1, std::memory_order_relaxed);
    if (record.record_id.empty()) {
        record.record_id = utils::generate_uuid();
    }
    if (!queue_.try_push(record)) {
        overflow_dropped_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug("Access log queue full, record dropped");
    }
    total_emitted_.fetch_add(1, std::memory_order_relaxed);
}

void AccessLogEmitter::flush() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        flush_requested_.store(true, std::memory_order_release);
    }
    flush_cv_.notify_one();

    while (flush_requested_.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
    }
}

void AccessLogEmitter::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }
    flush_cv_.notify_one();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

AccessLogEmitter::Stats AccessLogEmitter::get_stats() const {
    return Stats{
        .total_emitted = total_emitted_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .overflow_dropped = overflow_dropped_.load(std::memory_order_relaxed),
        .serialization_failures = serialization_failures_.load(std::memory_order_relaxed),
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void AccessLogEmitter::writer_loop() {
    std::vector<AccessRecord> batch;
    batch.reserve(kMaxBatchSize);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            flush_cv_.wait_for(lock, flush_interval_, [this] {
                return flush_requested_.load(std::memory_order_acquire)
                    || !running_.load(std::memory_order_acquire);
            });
        }

        // Latch before draining: a request raised after the drain stays set
        const bool flush_wanted = flush_requested_.load(std::memory_order_acquire);
        const bool stopping = !running_.load(std::memory_order_acquire);

        bool did_work = false;
        while (queue_.drain(batch, kMaxBatchSize) > 0) {
            try {
                write_batch(batch);
            } catch (const std::exception& e) {
                sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
                utils::log::error(std::format("Access log batch of {} records lost: {}",
                                              batch.size(), e.what()));
            }
            batch.clear();
            did_work = true;
        }

        if (flush_wanted || stopping) {
            if (did_work) flush_sinks();
            if (flush_wanted) flush_requested_.store(false, std::memory_order_release);
        }

        if (stopping) {
            for (auto& sink : sinks_) {
                sink->flush();
                sink->shutdown();
            }
            return;
        }
    }
}

void AccessLogEmitter::write_batch(std::vector<AccessRecord>& batch) {
    std::string output;
    output.reserve(batch.size() * 384);

    size_t written = 0;
    for (auto& record : batch) {
        // The chain only advances past records that made it into the output
        try {
            if (integrity_enabled_) {
                record.previous_hash = previous_hash_;
                record.record_hash = compute_record_hash(record, previous_hash_);
            }
            output += to_json(record);
            output += '\n';
        } catch (const nlohmann::json::exception& e) {
            serialization_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Access log record {} skipped: {}",
                                         record.sequence_num, e.what()));
            continue;
        }
        if (integrity_enabled_) {
            previous_hash_ = record.record_hash;
        }
        ++written;
    }
    if (written == 0) {
        return;
    }

    for (auto& sink : sinks_) {
        if (!sink->write(output)) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Access log write failed: {}", sink->name()));
        }
    }

    total_written_.fetch_add(written, std::memory_order_relaxed);
    flush_count_.fetch_add(1, std::memory_order_relaxed);

    if (++batches_since_fsync_ >= kFsyncInterval) {
        flush_sinks();
    }
}

void AccessLogEmitter::flush_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
    batches_since_fsync_ = 0;
}

// ============================================================================
// Serialization
// ============================================================================

std::string AccessLogEmitter::to_json(const AccessRecord& r) {
    nlohmann::json j = {
        {"record_id", r.record_id},
        {"sequence_num", r.sequence_num},
        {"timestamp", utils::format_timestamp(r.timestamp)},
        {"user_id", r.user_id},
        {"username", r.username},
        {"roles", r.roles},
        {"connection_id", r.table.connection_id},
        {"schema", r.table.schema},
        {"table", r.table.table},
        {"decision", r.decision},
        {"audit_only", r.audit_only},
        {"cache_hit", r.cache_hit},
        {"generation", r.generation},
        {"evaluation_time_us", r.evaluation_time.count()},
    };
    if (r.would_be) {
        j["would_be"] = *r.would_be;
    }
    if (!r.record_hash.empty()) {
        j["record_hash"] = r.record_hash;
        j["previous_hash"] = r.previous_hash;
    }
    return dump_json(j);
}

std::string AccessLogEmitter::compute_record_hash(
    const AccessRecord& record, const std::string& prev_hash) {

    std::string input;
    input.reserve(256);
    input += std::format("{}", record.sequence_num);
    input += '|';
    input += utils::format_timestamp(record.timestamp);
    input += '|';
    input += record.user_id;
    input += '|';
    input += record.table.connection_id + "/" + record.table.full_name();
    input += '|';
    input += dump_json(nlohmann::json(record.decision));
    input += '|';
    input += prev_hash;
    return utils::sha256_hex(input);
}

} // namespace rlsengine

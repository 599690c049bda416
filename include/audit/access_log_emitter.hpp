#pragma once

#include "audit/access_record.hpp"
#include "audit/access_record_queue.hpp"
#include "audit/audit_sink.hpp"
#include "config/config_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rlsengine {

/**
 * @brief Asynchronous, hash-chained access log
 *
 * Evaluating threads call emit(), which only enqueues into a bounded
 * lock-free queue. A background writer drains in batches, chains each
 * record to its predecessor with SHA-256 (when integrity is enabled),
 * serializes to JSONL and writes to every sink.
 *
 *   [evaluate()] --emit()--> [queue] --drain()--> [writer] --> [FileSink]
 *
 * A record that cannot be serialized is counted and skipped; it never
 * stops the writer.
 */
class AccessLogEmitter {
public:
    /// FileSink with rotation from the [audit] section
    explicit AccessLogEmitter(const AuditConfig& config);

    AccessLogEmitter(std::vector<std::unique_ptr<IAuditSink>> sinks,
                     bool integrity_enabled,
                     std::chrono::milliseconds flush_interval = std::chrono::milliseconds{100},
                     size_t queue_capacity = AccessRecordQueue::kDefaultCapacity);

    ~AccessLogEmitter();

    AccessLogEmitter(const AccessLogEmitter&) = delete;
    AccessLogEmitter& operator=(const AccessLogEmitter&) = delete;

    /// Non-blocking. Assigns the sequence number; drops on overflow.
    void emit(AccessRecord record);

    /// Block until everything emitted so far reached the sinks
    void flush();

    /// Drain, flush and close all sinks. Idempotent.
    void shutdown();

    struct Stats {
        uint64_t total_emitted;
        uint64_t total_written;
        uint64_t overflow_dropped;
        uint64_t serialization_failures;
        uint64_t flush_count;
        uint64_t sink_write_failures;
        size_t active_sinks;
    };
    [[nodiscard]] Stats get_stats() const;

    /// SHA-256 over sequence|timestamp|user|table|decision|previous hash
    [[nodiscard]] static std::string compute_record_hash(const AccessRecord& record,
                                                         const std::string& prev_hash);

    /// One JSON line (no trailing newline)
    [[nodiscard]] static std::string to_json(const AccessRecord& record);

private:
    void start();
    void writer_loop();
    void write_batch(std::vector<AccessRecord>& batch);
    void flush_sinks();

    static constexpr size_t kMaxBatchSize = 1000;
    static constexpr size_t kFsyncInterval = 10;

    std::vector<std::unique_ptr<IAuditSink>> sinks_;
    AccessRecordQueue queue_;

    std::thread writer_thread_;
    std::atomic<bool> running_{false};

    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    std::atomic<bool> flush_requested_{false};

    std::chrono::milliseconds flush_interval_{100};

    std::atomic<uint64_t> total_emitted_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> overflow_dropped_{0};
    std::atomic<uint64_t> serialization_failures_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
    std::atomic<uint64_t> sequence_counter_{0};

    // Writer thread only
    bool integrity_enabled_ = true;
    std::string previous_hash_;
    size_t batches_since_fsync_ = 0;
};

} // namespace rlsengine

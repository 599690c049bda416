#include <catch2/catch_test_macros.hpp>
#include "audit/access_log_emitter.hpp"
#include "audit/access_record_queue.hpp"
#include "audit/file_sink.hpp"
#include "mocks/mock_audit_sink.hpp"
#include "policy_fixtures.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <thread>
#include <vector>

using namespace rlsengine;
using namespace rlsengine::testing;
using json = nlohmann::json;

namespace {

AccessRecord make_record(const std::string& user_id) {
    AccessRecord r;
    r.timestamp = std::chrono::system_clock::now();
    r.user_id = user_id;
    r.username = user_id;
    r.roles = {"analyst"};
    r.table = kOrders;
    r.decision.has_filters = true;
    r.decision.where_clause = "region = 'US'";
    r.decision.policies_applied = {"us"};
    r.generation = 3;
    return r;
}

std::unique_ptr<AccessLogEmitter> make_emitter(const std::shared_ptr<MockAuditSink::State>& state,
                                               bool integrity) {
    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<MockAuditSink>(state));
    return std::make_unique<AccessLogEmitter>(std::move(sinks), integrity,
                                              std::chrono::milliseconds(10));
}

std::filesystem::path make_temp_dir() {
    auto dir = std::filesystem::temp_directory_path() /
               ("rls_audit_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    return dir;
}

} // anonymous namespace

// ============================================================================
// AccessLogEmitter
// ============================================================================

TEST_CASE("AccessLogEmitter: records are hash chained in order", "[access_log][integrity]") {
    auto state = std::make_shared<MockAuditSink::State>();
    auto emitter = make_emitter(state, true);

    for (const auto* user : {"alice", "bob", "carol"}) {
        emitter->emit(make_record(user));
    }
    emitter->flush();

    const auto lines = state->snapshot();
    REQUIRE(lines.size() == 3);

    std::string prev;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto j = json::parse(lines[i]);
        CHECK(j["sequence_num"] == i);
        CHECK(j["previous_hash"] == prev);
        const auto hash = j["record_hash"].get<std::string>();
        CHECK(hash.size() == 64);
        prev = hash;
    }

    auto stats = emitter->get_stats();
    CHECK(stats.total_emitted == 3);
    CHECK(stats.total_written == 3);
}

TEST_CASE("AccessLogEmitter: record hash", "[access_log][integrity]") {
    auto record = make_record("alice");
    const auto h1 = AccessLogEmitter::compute_record_hash(record, "");

    CHECK(h1.size() == 64);
    CHECK(AccessLogEmitter::compute_record_hash(record, "") == h1);
    CHECK(AccessLogEmitter::compute_record_hash(record, h1) != h1);

    record.decision = FilterDecision::denied("no_matching_policy");
    CHECK(AccessLogEmitter::compute_record_hash(record, "") != h1);
}

TEST_CASE("AccessLogEmitter: JSON line", "[access_log]") {
    auto record = make_record("alice");

    SECTION("enforcing record") {
        const auto j = json::parse(AccessLogEmitter::to_json(record));
        CHECK(j["user_id"] == "alice");
        CHECK(j["connection_id"] == "main");
        CHECK(j["schema"] == "public");
        CHECK(j["table"] == "orders");
        CHECK(j["decision"]["whereClause"] == "region = 'US'");
        CHECK(j["generation"] == 3);
        CHECK_FALSE(j.contains("would_be"));
        CHECK_FALSE(j.contains("record_hash"));
    }

    SECTION("audit-only record carries the would-be decision") {
        record.audit_only = true;
        record.would_be = record.decision;
        record.decision = FilterDecision::unrestricted();
        const auto j = json::parse(AccessLogEmitter::to_json(record));
        CHECK(j["audit_only"] == true);
        CHECK(j["decision"]["hasFilters"] == false);
        CHECK(j["would_be"]["whereClause"] == "region = 'US'");
    }
}

TEST_CASE("AccessLogEmitter: integrity disabled", "[access_log]") {
    auto state = std::make_shared<MockAuditSink::State>();
    auto emitter = make_emitter(state, false);

    emitter->emit(make_record("alice"));
    emitter->flush();

    const auto lines = state->snapshot();
    REQUIRE(lines.size() == 1);
    CHECK_FALSE(json::parse(lines[0]).contains("record_hash"));
}

TEST_CASE("AccessLogEmitter: shutdown drains and closes sinks", "[access_log]") {
    auto state = std::make_shared<MockAuditSink::State>();
    auto emitter = make_emitter(state, true);

    emitter->emit(make_record("alice"));
    emitter->shutdown();

    CHECK(state->snapshot().size() == 1);
    CHECK(state->shut_down.load());

    // Dropped after shutdown
    emitter->emit(make_record("bob"));
    emitter->flush();
    emitter->shutdown();
    CHECK(emitter->get_stats().total_emitted == 1);
    CHECK(state->snapshot().size() == 1);
}

TEST_CASE("AccessLogEmitter: sink failures are counted", "[access_log]") {
    auto state = std::make_shared<MockAuditSink::State>();
    state->fail_writes.store(true);
    auto emitter = make_emitter(state, true);

    emitter->emit(make_record("alice"));
    emitter->flush();

    CHECK(emitter->get_stats().sink_write_failures == 1);
    CHECK(state->snapshot().empty());
}

TEST_CASE("AccessLogEmitter: records that are not valid UTF-8 are still written", "[access_log]") {
    auto state = std::make_shared<MockAuditSink::State>();
    auto emitter = make_emitter(state, true);

    auto record = make_record("M\xfc" "ller");
    record.decision.where_clause = "department = 'M\xfc" "ller'";
    emitter->emit(record);
    emitter->emit(make_record("bob"));
    emitter->flush();

    const auto lines = state->snapshot();
    REQUIRE(lines.size() == 2);
    const auto first = json::parse(lines[0]);
    CHECK(first["user_id"] == "M\xef\xbf\xbd" "ller");
    CHECK(first["decision"]["whereClause"] == "department = 'M\xef\xbf\xbd" "ller'");
    CHECK(json::parse(lines[1])["previous_hash"] == first["record_hash"]);

    const auto stats = emitter->get_stats();
    CHECK(stats.total_written == 2);
    CHECK(stats.serialization_failures == 0);
}

TEST_CASE("AccessLogEmitter: a full queue drops and counts", "[access_log]") {
    auto state = std::make_shared<MockAuditSink::State>();
    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<MockAuditSink>(state));
    // Long interval: the writer only drains on flush()
    AccessLogEmitter emitter(std::move(sinks), false, std::chrono::seconds(30), 4);

    for (int i = 0; i < 6; ++i) {
        emitter.emit(make_record("user_" + std::to_string(i)));
    }
    emitter.flush();

    const auto lines = state->snapshot();
    REQUIRE(lines.size() == 4);
    CHECK(json::parse(lines[0])["user_id"] == "user_0");
    CHECK(json::parse(lines[3])["user_id"] == "user_3");

    const auto stats = emitter.get_stats();
    CHECK(stats.total_emitted == 6);
    CHECK(stats.overflow_dropped == 2);
    CHECK(stats.total_written == 4);
}

TEST_CASE("AccessLogEmitter: a throwing sink does not stop the writer", "[access_log]") {
    auto state = std::make_shared<MockAuditSink::State>();
    state->throw_on_write.store(true);
    auto emitter = make_emitter(state, true);

    emitter->emit(make_record("alice"));
    emitter->flush();
    CHECK(emitter->get_stats().sink_write_failures == 1);

    state->throw_on_write.store(false);
    emitter->emit(make_record("bob"));
    emitter->flush();

    const auto lines = state->snapshot();
    REQUIRE(lines.size() == 1);
    CHECK(json::parse(lines[0])["user_id"] == "bob");
}

TEST_CASE("AccessLogEmitter: file sink from the audit config", "[access_log][file]") {
    const auto dir = make_temp_dir();
    AuditConfig cfg;
    cfg.output_file = (dir / "access.jsonl").string();
    cfg.batch_flush_interval = std::chrono::milliseconds(10);

    {
        auto emitter = std::make_unique<AccessLogEmitter>(cfg);
        emitter->emit(make_record("alice"));
        emitter->emit(make_record("bob"));
    }

    std::ifstream in(cfg.output_file);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        CHECK(json::parse(line).contains("record_hash"));
        ++count;
    }
    CHECK(count == 2);

    std::filesystem::remove_all(dir);
}

// ============================================================================
// AccessRecordQueue
// ============================================================================

TEST_CASE("AccessRecordQueue: capacity rounds up to a power of two", "[access_log][queue]") {
    CHECK(AccessRecordQueue(0).capacity() == 2);
    CHECK(AccessRecordQueue(3).capacity() == 4);
    CHECK(AccessRecordQueue(8).capacity() == 8);
    CHECK(AccessRecordQueue().capacity() == AccessRecordQueue::kDefaultCapacity);
}

TEST_CASE("AccessRecordQueue: full queue rejects until drained", "[access_log][queue]") {
    AccessRecordQueue queue(4);
    std::vector<AccessRecord> batch;

    for (int i = 0; i < 4; ++i) {
        auto r = make_record("u" + std::to_string(i));
        REQUIRE(queue.try_push(r));
    }

    auto rejected = make_record("late");
    CHECK_FALSE(queue.try_push(rejected));
    CHECK(rejected.user_id == "late");

    CHECK(queue.drain(batch, 2) == 2);
    CHECK(batch[0].user_id == "u0");
    CHECK(batch[1].user_id == "u1");

    // Freed slots are reused on the next lap, order is kept
    REQUIRE(queue.try_push(rejected));
    auto again = make_record("later");
    REQUIRE(queue.try_push(again));
    CHECK_FALSE(queue.try_push(again));

    batch.clear();
    CHECK(queue.drain(batch, 100) == 4);
    REQUIRE(batch.size() == 4);
    CHECK(batch[0].user_id == "u2");
    CHECK(batch[1].user_id == "u3");
    CHECK(batch[2].user_id == "late");
    CHECK(batch[3].user_id == "later");

    batch.clear();
    CHECK(queue.drain(batch, 100) == 0);
}

TEST_CASE("AccessRecordQueue: concurrent producers lose nothing that was accepted", "[access_log][queue]") {
    AccessRecordQueue queue(1024);
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 200;

    std::atomic<int> accepted{0};
    {
        std::vector<std::jthread> producers;
        for (int p = 0; p < kProducers; ++p) {
            producers.emplace_back([&, p] {
                for (int i = 0; i < kPerProducer; ++i) {
                    auto r = make_record("p" + std::to_string(p));
                    r.sequence_num = static_cast<uint64_t>(i);
                    if (queue.try_push(r)) accepted.fetch_add(1);
                }
            });
        }
    }

    std::vector<AccessRecord> batch;
    CHECK(queue.drain(batch, 10000) == static_cast<size_t>(accepted.load()));
    CHECK(accepted.load() == kProducers * kPerProducer);

    // Per producer, records come out in the order they went in
    std::map<std::string, uint64_t> next;
    for (const auto& r : batch) {
        CHECK(r.sequence_num == next[r.user_id]);
        next[r.user_id] = r.sequence_num + 1;
    }
}

// ============================================================================
// FileSink
// ============================================================================

TEST_CASE("FileSink: size based rotation", "[access_log][file]") {
    const auto dir = make_temp_dir();
    FileSink::Config cfg;
    cfg.output_file = (dir / "access.jsonl").string();
    cfg.max_file_size_bytes = 10;
    cfg.max_files = 2;
    cfg.time_based_rotation = false;

    {
        FileSink sink(cfg);
        CHECK(sink.name() == "file:" + cfg.output_file);

        CHECK(sink.write("{\"n\":1}\n{\"n\":2}\n"));
        CHECK(sink.rotation_count() == 0);

        CHECK(sink.write("{\"n\":3}\n"));
        CHECK(sink.rotation_count() == 1);
        CHECK(sink.current_file_size() == 8);

        CHECK(sink.write("{\"n\":4}\n"));
        CHECK(sink.write("{\"n\":5}\n"));
        CHECK(sink.rotation_count() == 2);
        sink.flush();
    }

    CHECK(std::filesystem::exists(cfg.output_file + ".1"));
    CHECK(std::filesystem::exists(cfg.output_file + ".2"));
    CHECK_FALSE(std::filesystem::exists(cfg.output_file + ".3"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileSink: unwritable path throws", "[access_log][file]") {
    FileSink::Config cfg;
    cfg.output_file = "/nonexistent-dir/access.jsonl";
    CHECK_THROWS_AS(FileSink(cfg), std::runtime_error);
}

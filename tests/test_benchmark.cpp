#include <benchmark/benchmark.h>

#include "audit/access_log_emitter.hpp"
#include "cache/decision_cache.hpp"
#include "core/query_rewriter.hpp"
#include "engine/rls_engine.hpp"
#include "policy/condition_compiler.hpp"
#include "policy/filter_combiner.hpp"
#include "policy/policy_resolver.hpp"
#include "store/memory_policy_store.hpp"
#include "policy_fixtures.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace rlsengine;
using namespace rlsengine::testing;

// ============================================================================
// Helpers
// ============================================================================

namespace {

using Op = ConditionOperator;

// One policy per table plus a department filter shared across all of them
std::vector<RlsPolicy> make_policies(int count) {
    std::vector<RlsPolicy> policies;
    policies.reserve(static_cast<size_t>(count) + 1);
    for (int i = 0; i < count; ++i) {
        auto policy = make_policy("p" + std::to_string(i),
                                  where(static_condition("c", "tenant_id", Op::EQUALS, i)),
                                  {"analyst"}, "table_" + std::to_string(i));
        policy.priority = i % 5;
        policies.push_back(std::move(policy));
    }
    policies.push_back(make_policy("dept",
        where(dynamic_condition("c", "department", Op::EQUALS, BuiltinAttribute::DEPARTMENT)),
        {"analyst"}));
    return policies;
}

/// (region IN user.region OR owner_id = user.user_id) AND deleted_at IS NULL
ConditionGroup make_nested_group() {
    auto either = make_group("either", GroupLogic::OR, {
        dynamic_condition("r", "region", Op::IN, BuiltinAttribute::REGION),
        dynamic_condition("o", "owner_id", Op::EQUALS, BuiltinAttribute::USER_ID),
    });
    return make_group("root", GroupLogic::AND,
                      {static_condition("d", "deleted_at", Op::IS_NULL, nullptr)},
                      {either});
}

UserSecurityContext bench_user(const std::string& id = "alice") {
    return make_user(id, {"analyst"}, {
        {"department", "sales"},
        {"region", AttributeValue::array({"US", "EU"})},
    });
}

std::unique_ptr<RlsEngine> make_engine(int policy_count, int ttl_seconds) {
    RlsConfiguration config;
    config.cache_ttl_seconds = ttl_seconds;
    auto store = std::make_shared<MemoryPolicyStore>(config);
    (void)store->replace_all({make_role("analyst")}, make_policies(policy_count));
    auto engine = std::make_unique<RlsEngine>(store, CacheConfig{}, RefreshConfig{});
    (void)engine->initialize();
    return engine;
}

} // anonymous namespace

// ============================================================================
// Category A: Component Latency
// ============================================================================

// A1: Compile a nested condition group
static void BM_ConditionCompiler_Nested(benchmark::State& state) {
    const auto group = make_nested_group();
    const auto user = bench_user();
    for (auto _ : state) {
        auto compiled = ConditionCompiler::compile(group, user);
        benchmark::DoNotOptimize(compiled);
    }
}
BENCHMARK(BM_ConditionCompiler_Nested);

// A2: Resolve applicable policies
static void BM_PolicyResolver_Resolve(benchmark::State& state) {
    const auto policies = make_policies(100);
    const auto user = bench_user();
    const TableIdentity table("main", "public", "table_50");
    for (auto _ : state) {
        auto applicable = PolicyResolver::resolve(policies, table, user);
        benchmark::DoNotOptimize(applicable);
    }
}
BENCHMARK(BM_PolicyResolver_Resolve);

// A3: Resolve + compile + combine
static void BM_FilterCombiner_Combine(benchmark::State& state) {
    const auto policies = make_policies(100);
    const auto user = bench_user();
    const TableIdentity table("main", "public", "table_50");
    const auto applicable = PolicyResolver::resolve(policies, table, user);
    for (auto _ : state) {
        auto combined = FilterCombiner::combine(applicable, user);
        benchmark::DoNotOptimize(combined);
    }
}
BENCHMARK(BM_FilterCombiner_Combine);

// A4: Cache key derivation (includes SHA-256 of the identity)
static void BM_DecisionCache_MakeKey(benchmark::State& state) {
    const auto user = bench_user();
    const TableIdentity table("main", "public", "orders");
    for (auto _ : state) {
        auto key = DecisionCache::make_key(table, user, 42);
        benchmark::DoNotOptimize(key);
    }
}
BENCHMARK(BM_DecisionCache_MakeKey);

// A5: Query rewrite with an existing WHERE
static void BM_QueryRewriter_Inject(benchmark::State& state) {
    FilterDecision decision;
    decision.has_filters = true;
    decision.where_clause = "(region = 'US') OR (owner_id = 'alice')";
    const std::string sql =
        "SELECT o.id, o.total FROM orders o WHERE o.status = 'open' "
        "AND o.id IN (SELECT order_id FROM items WHERE qty > 1) ORDER BY o.total DESC LIMIT 50";
    for (auto _ : state) {
        auto rewritten = QueryRewriter::rewrite(sql, decision);
        benchmark::DoNotOptimize(rewritten);
    }
}
BENCHMARK(BM_QueryRewriter_Inject);

// ============================================================================
// Category B: Engine End-to-end
// ============================================================================

// B1: Cached evaluation
static void BM_RlsEngine_CacheHit(benchmark::State& state) {
    auto engine = make_engine(10, 300);
    const auto user = bench_user();
    const TableIdentity table("main", "public", "table_5");
    (void)engine->evaluate(table, user);
    for (auto _ : state) {
        auto decision = engine->evaluate(table, user);
        benchmark::DoNotOptimize(decision);
    }
}
BENCHMARK(BM_RlsEngine_CacheHit);

// B2: Uncached evaluation (TTL 0)
static void BM_RlsEngine_CacheDisabled(benchmark::State& state) {
    auto engine = make_engine(10, 0);
    const auto user = bench_user();
    const TableIdentity table("main", "public", "table_5");
    for (auto _ : state) {
        auto decision = engine->evaluate(table, user);
        benchmark::DoNotOptimize(decision);
    }
}
BENCHMARK(BM_RlsEngine_CacheDisabled);

// B3: Uncached evaluation vs. number of policies
static void BM_RlsEngine_PolicyCount(benchmark::State& state) {
    auto engine = make_engine(static_cast<int>(state.range(0)), 0);
    const auto user = bench_user();
    const TableIdentity table("main", "public", "table_0");
    for (auto _ : state) {
        auto decision = engine->evaluate(table, user);
        benchmark::DoNotOptimize(decision);
    }
}
BENCHMARK(BM_RlsEngine_PolicyCount)->Arg(1)->Arg(10)->Arg(100)->Arg(1000);

// B4: Evaluation throughput under contention (distinct users, shared cache)
static void BM_RlsEngine_Throughput(benchmark::State& state) {
    static std::unique_ptr<RlsEngine> engine;
    static std::once_flag init;
    std::call_once(init, [] { engine = make_engine(100, 300); });

    const auto user = bench_user("user_" + std::to_string(state.thread_index()));
    const TableIdentity table("main", "public", "table_50");
    for (auto _ : state) {
        auto decision = engine->evaluate(table, user);
        benchmark::DoNotOptimize(decision);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RlsEngine_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

// B5: Access log emit (lock-free queue push)
static void BM_AccessLog_Emit(benchmark::State& state) {
    AuditConfig cfg;
    cfg.output_file = "/dev/null";
    cfg.rotation_size_based = false;
    cfg.rotation_time_based = false;
    auto access_log = std::make_unique<AccessLogEmitter>(cfg);

    AccessRecord record;
    record.user_id = "bench_user";
    record.table = TableIdentity("main", "public", "orders");
    record.decision.has_filters = true;
    record.decision.where_clause = "region = 'US'";
    for (auto _ : state) {
        access_log->emit(record);
    }
    state.SetItemsProcessed(state.iterations());
    access_log->shutdown();
}
BENCHMARK(BM_AccessLog_Emit);

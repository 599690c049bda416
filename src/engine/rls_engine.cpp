#include "engine/rls_engine.hpp"
#include "core/utils.hpp"
#include "policy/filter_combiner.hpp"
#include "policy/policy_resolver.hpp"

#include <format>

namespace rlsengine {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ',';
        out += item;
    }
    return out;
}

} // anonymous namespace

RlsEngine::RlsEngine(std::shared_ptr<IPolicyStore> store,
                     const CacheConfig& cache_config,
                     const RefreshConfig& refresh_config,
                     std::shared_ptr<AccessLogEmitter> access_log)
    : store_(store),
      cache_(DecisionCache::Config{
          .max_entries = cache_config.max_entries,
          .num_shards = cache_config.num_shards,
      }),
      loader_(std::move(store), refresh_config),
      access_log_(std::move(access_log)) {}

RlsEngine::~RlsEngine() {
    stop();
}

Result<Done> RlsEngine::initialize() {
    auto result = loader_.refresh();
    if (result.is_ok()) {
        const auto snap = loader_.latest();
        utils::log::info(std::format("RLS engine ready: generation {}, {} policies, {} roles",
                                     snap->generation, snap->policies.size(), snap->roles.size()));
    }
    return result;
}

void RlsEngine::start() {
    loader_.start([this] {
        const size_t removed = sweep_cache();
        if (removed > 0) {
            utils::log::debug(std::format("Decision cache sweep removed {} entries", removed));
        }
    });
}

void RlsEngine::stop() {
    loader_.stop();
}

size_t RlsEngine::sweep_cache() {
    const auto snap = loader_.latest();
    if (!snap) return 0;
    return cache_.sweep(snap->generation, std::chrono::seconds(snap->config.cache_ttl_seconds));
}

// ============================================================================
// Evaluation
// ============================================================================

FilterDecision RlsEngine::evaluate(
    const std::string& connection_id,
    const std::string& schema_name,
    const std::string& table_name,
    const UserSecurityContext& user) {
    return evaluate(TableIdentity(connection_id, schema_name, table_name), user);
}

FilterDecision RlsEngine::evaluate(const TableIdentity& table, const UserSecurityContext& user) {
    return evaluate_outcome(table, user).enforced;
}

GateOutcome RlsEngine::evaluate_outcome(const TableIdentity& table,
                                        const UserSecurityContext& user) {
    utils::Timer timer;

    const auto snapshot = loader_.current();
    if (!snapshot) {
        utils::log::warn(std::format("No usable policy snapshot, denying {} on {}",
                                     user.user_id, table.full_name()));
        auto outcome = EnforcementGate::unavailable();
        record_access(table, user, outcome, 0, false, timer.elapsed_us());
        return outcome;
    }

    const auto& config = snapshot->config;
    CombinedFilter combined;
    bool cache_hit = false;

    if (config.enabled) {
        const std::chrono::seconds ttl(config.cache_ttl_seconds);
        const bool caching = ttl.count() > 0;
        std::string key;

        if (caching) {
            key = DecisionCache::make_key(table, user, snapshot->generation);
            if (auto cached = cache_.get(key, snapshot->generation, ttl)) {
                combined = std::move(*cached);
                cache_hit = true;
            }
        }

        if (!cache_hit) {
            const auto applicable = PolicyResolver::resolve(snapshot->policies, table, user);
            combined = FilterCombiner::combine(applicable, user);
            if (caching) {
                cache_.put(key, snapshot->generation, combined);
            }
        }
    }

    auto outcome = EnforcementGate::apply(config, combined);

    if (outcome.audit_only && outcome.would_be != outcome.enforced) {
        utils::log::info(std::format(
            "RLS audit mode: {} on {} would be {} (policies: [{}])",
            user.user_id, table.full_name(),
            outcome.would_be.access_denied
                ? std::format("denied ({})", outcome.would_be.denial_reason.value_or(""))
                : std::format("filtered by {}", outcome.would_be.where_clause.value_or("")),
            join(outcome.would_be.policies_applied)));
    }

    if (outcome.should_log) {
        record_access(table, user, outcome, snapshot->generation, cache_hit, timer.elapsed_us());
    }
    return outcome;
}

void RlsEngine::record_access(const TableIdentity& table,
                              const UserSecurityContext& user,
                              const GateOutcome& outcome,
                              uint64_t generation,
                              bool cache_hit,
                              std::chrono::microseconds elapsed) {
    utils::log::debug(std::format(
        "RLS access: user={} table={}/{} policies=[{}] filtered={} denied={}{}",
        user.user_id, table.connection_id, table.full_name(),
        join(outcome.enforced.policies_applied),
        utils::booltostr(outcome.enforced.has_filters),
        utils::booltostr(outcome.enforced.access_denied),
        cache_hit ? " (cached)" : ""));

    if (!access_log_) return;

    AccessRecord record;
    record.timestamp = utils::now();
    record.user_id = user.user_id;
    record.username = user.username;
    record.roles = user.sorted_roles();
    record.table = table;
    record.decision = outcome.enforced;
    if (outcome.audit_only) {
        record.would_be = outcome.would_be;
    }
    record.audit_only = outcome.audit_only;
    record.cache_hit = cache_hit;
    record.generation = generation;
    record.evaluation_time = elapsed;
    access_log_->emit(std::move(record));
}

} // namespace rlsengine

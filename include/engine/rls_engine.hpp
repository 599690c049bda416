#pragma once

#include "audit/access_log_emitter.hpp"
#include "cache/decision_cache.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "engine/snapshot_loader.hpp"
#include "policy/enforcement_gate.hpp"
#include "store/ipolicy_store.hpp"

#include <memory>
#include <string>

namespace rlsengine {

/**
 * @brief Row-level security engine facade
 *
 * evaluate() flow:
 *   snapshot -> cache lookup -> (miss) resolve -> compile -> combine
 *   -> cache store -> enforcement gate -> access log
 *
 * Evaluation is a pure function of (snapshot, request). Shared state is the
 * sharded decision cache and the atomically published snapshot, so any
 * number of threads may call evaluate() concurrently.
 */
class RlsEngine {
public:
    RlsEngine(std::shared_ptr<IPolicyStore> store,
              const CacheConfig& cache_config,
              const RefreshConfig& refresh_config,
              std::shared_ptr<AccessLogEmitter> access_log = nullptr);

    ~RlsEngine();

    RlsEngine(const RlsEngine&) = delete;
    RlsEngine& operator=(const RlsEngine&) = delete;

    /// Load the first snapshot (with retries)
    [[nodiscard]] Result<Done> initialize();

    /// Background refresh and cache sweep
    void start();
    void stop();

    [[nodiscard]] FilterDecision evaluate(
        const std::string& connection_id,
        const std::string& schema_name,
        const std::string& table_name,
        const UserSecurityContext& user);

    [[nodiscard]] FilterDecision evaluate(const TableIdentity& table,
                                          const UserSecurityContext& user);

    /// Full gate outcome, including the would-be decision in audit mode
    [[nodiscard]] GateOutcome evaluate_outcome(const TableIdentity& table,
                                               const UserSecurityContext& user);

    [[nodiscard]] Result<Done> refresh() { return loader_.refresh(); }

    [[nodiscard]] std::shared_ptr<const PolicySnapshot> snapshot() const {
        return loader_.current();
    }

    /// Drop stale cache entries against the current snapshot
    size_t sweep_cache();

    [[nodiscard]] DecisionCache::Stats cache_stats() const { return cache_.get_stats(); }
    [[nodiscard]] SnapshotLoader::Stats loader_stats() const { return loader_.get_stats(); }

private:
    void record_access(const TableIdentity& table,
                       const UserSecurityContext& user,
                       const GateOutcome& outcome,
                       uint64_t generation,
                       bool cache_hit,
                       std::chrono::microseconds elapsed);

    std::shared_ptr<IPolicyStore> store_;
    DecisionCache cache_;
    SnapshotLoader loader_;
    std::shared_ptr<AccessLogEmitter> access_log_;
};

} // namespace rlsengine

#pragma once

#include "core/types.hpp"
#include "policy/policy_codec.hpp"
#include "policy/policy_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rlsengine {

/**
 * @brief What one policy would do for one user on one table
 */
struct PolicyTestResult {
    bool policy_would_apply = false;
    std::optional<std::string> where_clause;
    bool access_denied = false;
    std::optional<std::string> denial_reason;
    FilterDecision decision;
};

struct SimulationDiff {
    size_t request_index = 0;
    std::string user_id;
    TableIdentity table;
    FilterDecision baseline;
    FilterDecision proposed;
};

struct SimulationResult {
    size_t total_requests = 0;
    size_t changed = 0;
    size_t newly_denied = 0;
    size_t newly_allowed = 0;
    size_t unchanged = 0;
    std::vector<SimulationDiff> diffs;
    std::chrono::microseconds duration{0};
};

/**
 * @brief Dry-run evaluation outside the live engine (no cache, no access log)
 *
 * Decisions are the enforcing ones: audit mode in `config` is ignored so the
 * administrator sees what enforcement would produce.
 */
class PolicyTester {
public:
    [[nodiscard]] static PolicyTestResult test_policy(
        const RlsPolicy& policy,
        const UserSecurityContext& user,
        const RlsConfiguration& config,
        const TableIdentity& table);

    /// Decision of a whole policy set for one request
    [[nodiscard]] static FilterDecision evaluate(
        const std::vector<RlsPolicy>& policies,
        const RlsConfiguration& config,
        const TableIdentity& table,
        const UserSecurityContext& user);

    /// Compare a proposed policy set against a baseline over the same requests
    [[nodiscard]] static SimulationResult simulate(
        const std::vector<RlsPolicy>& baseline,
        const std::vector<RlsPolicy>& proposed,
        const RlsConfiguration& config,
        const std::vector<EvaluationRequest>& requests,
        size_t max_diffs = 100);
};

} // namespace rlsengine

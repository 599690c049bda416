#include "policy/policy_tester.hpp"
#include "core/utils.hpp"
#include "policy/enforcement_gate.hpp"
#include "policy/filter_combiner.hpp"
#include "policy/policy_resolver.hpp"

namespace rlsengine {

namespace {

RlsConfiguration enforcing(RlsConfiguration config) {
    config.audit_mode = false;
    return config;
}

} // anonymous namespace

PolicyTestResult PolicyTester::test_policy(
    const RlsPolicy& policy,
    const UserSecurityContext& user,
    const RlsConfiguration& config,
    const TableIdentity& table) {

    PolicyTestResult result;
    result.policy_would_apply = config.enabled && PolicyResolver::applies(policy, table, user);

    std::vector<const RlsPolicy*> applicable;
    if (result.policy_would_apply) {
        applicable.push_back(&policy);
    }

    const auto combined = FilterCombiner::combine(applicable, user);
    result.decision = EnforcementGate::apply(enforcing(config), combined).enforced;
    result.where_clause = result.decision.where_clause;
    result.access_denied = result.decision.access_denied;
    result.denial_reason = result.decision.denial_reason;
    return result;
}

FilterDecision PolicyTester::evaluate(
    const std::vector<RlsPolicy>& policies,
    const RlsConfiguration& config,
    const TableIdentity& table,
    const UserSecurityContext& user) {

    const auto cfg = enforcing(config);
    CombinedFilter combined;
    if (cfg.enabled) {
        combined = FilterCombiner::combine(PolicyResolver::resolve(policies, table, user), user);
    }
    return EnforcementGate::apply(cfg, combined).enforced;
}

SimulationResult PolicyTester::simulate(
    const std::vector<RlsPolicy>& baseline,
    const std::vector<RlsPolicy>& proposed,
    const RlsConfiguration& config,
    const std::vector<EvaluationRequest>& requests,
    size_t max_diffs) {

    utils::Timer timer;
    SimulationResult result;
    result.total_requests = requests.size();

    for (size_t i = 0; i < requests.size(); ++i) {
        const auto& req = requests[i];
        auto before = evaluate(baseline, config, req.table, req.user);
        auto after = evaluate(proposed, config, req.table, req.user);

        if (before == after) {
            ++result.unchanged;
            continue;
        }

        ++result.changed;
        if (!before.access_denied && after.access_denied) ++result.newly_denied;
        if (before.access_denied && !after.access_denied) ++result.newly_allowed;

        if (result.diffs.size() < max_diffs) {
            result.diffs.push_back(SimulationDiff{
                .request_index = i,
                .user_id = req.user.user_id,
                .table = req.table,
                .baseline = std::move(before),
                .proposed = std::move(after),
            });
        }
    }

    result.duration = timer.elapsed_us();
    return result;
}

} // namespace rlsengine

#include "policy/enforcement_gate.hpp"
#include "policy/policy_constants.hpp"

namespace rlsengine {

GateOutcome EnforcementGate::apply(
    const RlsConfiguration& config,
    const CombinedFilter& combined) {

    GateOutcome outcome;

    if (!config.enabled) {
        return outcome;
    }

    FilterDecision decision;
    if (combined.no_matching_policy) {
        if (config.default_deny) {
            decision = FilterDecision::denied(std::string(policy::kNoMatchingPolicy));
        }
    } else {
        decision.has_filters = combined.has_filters;
        decision.where_clause = combined.where_clause;
        decision.policies_applied = combined.policies_applied;
    }

    outcome.would_be = decision;
    outcome.should_log = config.log_access || config.audit_mode;

    if (config.audit_mode) {
        decision.has_filters = false;
        decision.where_clause.reset();
        decision.access_denied = false;
        decision.denial_reason.reset();
        outcome.audit_only = true;
    }

    outcome.enforced = std::move(decision);
    return outcome;
}

GateOutcome EnforcementGate::unavailable() {
    GateOutcome outcome;
    outcome.enforced = FilterDecision::denied(std::string(policy::kEngineUnavailable));
    outcome.would_be = outcome.enforced;
    outcome.should_log = true;
    return outcome;
}

} // namespace rlsengine

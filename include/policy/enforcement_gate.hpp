#pragma once

#include "core/types.hpp"
#include "policy/filter_combiner.hpp"
#include "policy/policy_types.hpp"

namespace rlsengine {

/**
 * @brief Result of gating one combined filter
 *
 * `enforced` is returned to the caller. `would_be` is what enforcement
 * would produce; it differs from `enforced` only in audit mode.
 */
struct GateOutcome {
    FilterDecision enforced;
    FilterDecision would_be;
    bool audit_only = false;
    bool should_log = false;
};

/**
 * @brief Enforcement Gate - applies RlsConfiguration to the combiner output
 *
 * Order of rules:
 *   1. enabled == false -> unrestricted, not logged
 *   2. no applicable policy -> denied iff default_deny ("no_matching_policy")
 *   3. combined filter as-is
 *   4. audit_mode downgrades the result to non-enforcing
 */
class EnforcementGate {
public:
    [[nodiscard]] static GateOutcome apply(
        const RlsConfiguration& config,
        const CombinedFilter& combined);

    /// Fail-closed outcome when no usable snapshot exists (never audit-downgraded)
    [[nodiscard]] static GateOutcome unavailable();
};

} // namespace rlsengine

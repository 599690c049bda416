#pragma once

#include "core/types.hpp"
#include "policy/condition_compiler.hpp"
#include "policy/policy_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rlsengine {

/**
 * @brief Combiner output, before the Enforcement Gate applies configuration
 */
struct CombinedFilter {
    bool no_matching_policy = false;        // No policy applied at all
    bool has_filters = false;
    std::optional<std::string> where_clause;
    std::vector<std::string> policies_applied;

    bool operator==(const CombinedFilter&) const = default;
};

/**
 * @brief Filter Combiner - OR of independent per-policy grants
 *
 * - No applicable policy: no_matching_policy, the gate decides.
 * - Any policy compiling to constant true: unrestricted, all ids listed.
 * - Constant false policies are listed but contribute no disjunct.
 * - Every policy false: where_clause = "1=0".
 */
class FilterCombiner {
public:
    struct Input {
        std::string policy_id;
        CompiledPredicate predicate;
    };

    /// Compile each applicable policy for the user and combine
    [[nodiscard]] static CombinedFilter combine(
        const std::vector<const RlsPolicy*>& applicable,
        const UserSecurityContext& user);

    [[nodiscard]] static CombinedFilter combine(const std::vector<Input>& compiled);
};

} // namespace rlsengine

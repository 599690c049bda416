#pragma once

#include "core/error.hpp"
#include "policy/policy_types.hpp"

#include <string>
#include <unordered_set>

namespace rlsengine {

/**
 * @brief Save-time checks for policies, roles and configuration
 *
 * Rejects what the compiler would otherwise silently fold to false:
 * unknown role ids, missing ids/columns, a `custom` attribute without a
 * name, empty expressions and static values that do not fit the operator.
 */
class PolicyValidator {
public:
    [[nodiscard]] static Result<Done> validate_policy(
        const RlsPolicy& policy,
        const std::unordered_set<std::string>& known_role_ids);

    [[nodiscard]] static Result<Done> validate_group(const ConditionGroup& group);

    [[nodiscard]] static Result<Done> validate_condition(const RlsCondition& condition);

    [[nodiscard]] static Result<Done> validate_role(const SecurityRole& role);

    [[nodiscard]] static Result<Done> validate_config(const RlsConfiguration& config);
};

} // namespace rlsengine

#pragma once

#include "core/types.hpp"
#include "policy/policy_types.hpp"

#include <vector>

namespace rlsengine {

/**
 * @brief Policy Resolver - selects the policies that govern one request
 *
 * A policy applies when:
 * - it is enabled
 * - its connection/schema/table scope matches or is absent
 * - its role_ids is empty or intersects the user's roles
 *
 * Output is ordered by priority descending (absent = 0), then id ascending.
 * Priority orders output only and never suppresses a policy.
 */
class PolicyResolver {
public:
    [[nodiscard]] static std::vector<const RlsPolicy*> resolve(
        const std::vector<RlsPolicy>& policies,
        const TableIdentity& table,
        const UserSecurityContext& user);

    [[nodiscard]] static bool applies(
        const RlsPolicy& policy,
        const TableIdentity& table,
        const UserSecurityContext& user);

    [[nodiscard]] static bool scope_matches(const RlsPolicy& policy, const TableIdentity& table);
    [[nodiscard]] static bool roles_match(const RlsPolicy& policy, const UserSecurityContext& user);
};

} // namespace rlsengine

#include "policy/policy_resolver.hpp"

#include <algorithm>

namespace rlsengine {

namespace {

bool field_matches(const std::optional<std::string>& scope, const std::string& value) {
    return !scope.has_value() || *scope == value;
}

} // anonymous namespace

bool PolicyResolver::scope_matches(const RlsPolicy& policy, const TableIdentity& table) {
    return field_matches(policy.connection_id, table.connection_id) &&
           field_matches(policy.schema_name, table.schema) &&
           field_matches(policy.table_name, table.table);
}

bool PolicyResolver::roles_match(const RlsPolicy& policy, const UserSecurityContext& user) {
    if (policy.role_ids.empty()) return true;
    return std::any_of(policy.role_ids.begin(), policy.role_ids.end(),
        [&user](const std::string& role_id) { return user.has_role(role_id); });
}

bool PolicyResolver::applies(
    const RlsPolicy& policy,
    const TableIdentity& table,
    const UserSecurityContext& user) {

    return policy.enabled && scope_matches(policy, table) && roles_match(policy, user);
}

std::vector<const RlsPolicy*> PolicyResolver::resolve(
    const std::vector<RlsPolicy>& policies,
    const TableIdentity& table,
    const UserSecurityContext& user) {

    std::vector<const RlsPolicy*> result;
    for (const auto& policy : policies) {
        if (applies(policy, table, user)) {
            result.push_back(&policy);
        }
    }

    std::sort(result.begin(), result.end(), [](const RlsPolicy* a, const RlsPolicy* b) {
        const int pa = a->effective_priority();
        const int pb = b->effective_priority();
        if (pa != pb) return pa > pb;
        return a->id < b->id;
    });

    return result;
}

} // namespace rlsengine

#include "security/object_permissions.hpp"

namespace rlsengine {

std::string_view permission_level_to_string(PermissionLevel level) {
    switch (level) {
        case PermissionLevel::NONE:  return "none";
        case PermissionLevel::VIEW:  return "view";
        case PermissionLevel::EDIT:  return "edit";
        case PermissionLevel::ADMIN: return "admin";
    }
    return "none";
}

std::optional<PermissionLevel> parse_permission_level(std::string_view s) {
    if (s == "none") return PermissionLevel::NONE;
    if (s == "view") return PermissionLevel::VIEW;
    if (s == "edit") return PermissionLevel::EDIT;
    if (s == "admin") return PermissionLevel::ADMIN;
    return std::nullopt;
}

namespace {

bool grant_covers(const ObjectPermissionGrant& grant,
                  const std::string& object_type,
                  const std::string& object_id) {
    return (grant.object_type.empty() || grant.object_type == object_type) &&
           (grant.object_id.empty() || grant.object_id == object_id);
}

bool grant_reaches(const ObjectPermissionGrant& grant, const UserSecurityContext& user) {
    if (grant.user_id && *grant.user_id == user.user_id) return true;
    return grant.role_id && user.has_role(*grant.role_id);
}

} // anonymous namespace

PermissionLevel ObjectPermissions::effective_permission(
    const UserSecurityContext& user,
    const std::string& object_type,
    const std::string& object_id,
    const std::vector<ObjectPermissionGrant>& grants) {

    PermissionLevel best = PermissionLevel::NONE;
    for (const auto& grant : grants) {
        if (!grant_covers(grant, object_type, object_id)) continue;
        if (!grant_reaches(grant, user)) continue;
        if (has_permission(grant.level, best)) best = grant.level;
    }
    return best;
}

bool ObjectPermissions::check_object_permission(
    const UserSecurityContext& user,
    const std::string& object_type,
    const std::string& object_id,
    PermissionLevel required,
    const std::vector<ObjectPermissionGrant>& grants) {

    return has_permission(effective_permission(user, object_type, object_id, grants), required);
}

} // namespace rlsengine

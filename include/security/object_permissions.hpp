#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlsengine {

/// Object-level access, ordered: NONE < VIEW < EDIT < ADMIN
enum class PermissionLevel {
    NONE = 0,
    VIEW = 1,
    EDIT = 2,
    ADMIN = 3
};

[[nodiscard]] std::string_view permission_level_to_string(PermissionLevel level);
[[nodiscard]] std::optional<PermissionLevel> parse_permission_level(std::string_view s);

/**
 * @brief A grant of a permission level on one object to a user or a role
 *
 * Empty object_type/object_id match any object.
 */
struct ObjectPermissionGrant {
    std::string object_type;
    std::string object_id;
    std::optional<std::string> user_id;
    std::optional<std::string> role_id;
    PermissionLevel level = PermissionLevel::NONE;
};

/**
 * @brief Object permission checks (dashboards, datasets, ...) next to row filters
 */
class ObjectPermissions {
public:
    [[nodiscard]] static bool has_permission(PermissionLevel effective, PermissionLevel required) {
        return static_cast<int>(effective) >= static_cast<int>(required);
    }

    /// Highest level granted to the user directly or through any held role
    [[nodiscard]] static PermissionLevel effective_permission(
        const UserSecurityContext& user,
        const std::string& object_type,
        const std::string& object_id,
        const std::vector<ObjectPermissionGrant>& grants);

    [[nodiscard]] static bool check_object_permission(
        const UserSecurityContext& user,
        const std::string& object_type,
        const std::string& object_id,
        PermissionLevel required,
        const std::vector<ObjectPermissionGrant>& grants);
};

} // namespace rlsengine

#include <catch2/catch_test_macros.hpp>
#include "security/object_permissions.hpp"
#include "policy_fixtures.hpp"

using namespace rlsengine;
using namespace rlsengine::testing;

static ObjectPermissionGrant user_grant(std::string user, std::string type, std::string id,
                                        PermissionLevel level) {
    ObjectPermissionGrant g;
    g.object_type = std::move(type);
    g.object_id = std::move(id);
    g.user_id = std::move(user);
    g.level = level;
    return g;
}

static ObjectPermissionGrant role_grant(std::string role, std::string type, std::string id,
                                        PermissionLevel level) {
    ObjectPermissionGrant g;
    g.object_type = std::move(type);
    g.object_id = std::move(id);
    g.role_id = std::move(role);
    g.level = level;
    return g;
}

TEST_CASE("ObjectPermissions: level ordering", "[permissions]") {
    using enum PermissionLevel;
    CHECK(ObjectPermissions::has_permission(ADMIN, EDIT));
    CHECK(ObjectPermissions::has_permission(VIEW, VIEW));
    CHECK_FALSE(ObjectPermissions::has_permission(VIEW, EDIT));
    CHECK(ObjectPermissions::has_permission(NONE, NONE));
}

TEST_CASE("ObjectPermissions: level names", "[permissions]") {
    CHECK(permission_level_to_string(PermissionLevel::EDIT) == "edit");
    CHECK(parse_permission_level("admin") == PermissionLevel::ADMIN);
    CHECK_FALSE(parse_permission_level("owner").has_value());
}

TEST_CASE("ObjectPermissions: effective permission", "[permissions]") {
    const auto alice = make_user("alice", {"analyst"});
    const std::vector<ObjectPermissionGrant> grants = {
        user_grant("alice", "dashboard", "d1", PermissionLevel::VIEW),
        role_grant("analyst", "dashboard", "d1", PermissionLevel::EDIT),
        role_grant("admin", "dashboard", "d1", PermissionLevel::ADMIN),
        user_grant("bob", "dashboard", "d2", PermissionLevel::ADMIN),
        role_grant("analyst", "dataset", "", PermissionLevel::VIEW),
    };

    SECTION("highest of direct and role grants") {
        CHECK(ObjectPermissions::effective_permission(alice, "dashboard", "d1", grants)
              == PermissionLevel::EDIT);
    }

    SECTION("grants for other users and objects do not leak") {
        CHECK(ObjectPermissions::effective_permission(alice, "dashboard", "d2", grants)
              == PermissionLevel::NONE);
    }

    SECTION("empty object id covers every object of the type") {
        CHECK(ObjectPermissions::check_object_permission(alice, "dataset", "sales",
                                                         PermissionLevel::VIEW, grants));
        CHECK_FALSE(ObjectPermissions::check_object_permission(alice, "dataset", "sales",
                                                               PermissionLevel::EDIT, grants));
    }

    SECTION("NONE is always satisfied") {
        CHECK(ObjectPermissions::check_object_permission(make_user("nobody"), "dashboard", "d9",
                                                         PermissionLevel::NONE, {}));
    }
}

#pragma once

#include "policy/policy_types.hpp"

#include <string>
#include <vector>

namespace rlsengine {

/**
 * @brief Roles and policies read from a seed file
 */
struct PolicySeed {
    std::vector<SecurityRole> roles;
    std::vector<RlsPolicy> policies;
};

/**
 * @brief Policy seed loader from TOML
 *
 * Layout:
 *   [[roles]]                          id, name, description, is_default, priority
 *   [[policies]]                       id, name, description, enabled, priority,
 *                                      connection, schema, table, roles
 *   [policies.filter_group]            id, logic
 *   [[policies.filter_group.conditions]]
 *                                      id, column, operator, filter_type,
 *                                      value | user_attribute (+ custom_attribute) | expression
 *   [[policies.filter_group.groups]]   nested groups, same shape
 *
 * filter_type may be omitted: expression -> expression, user_attribute ->
 * dynamic, otherwise static. Only structure and enum names are checked here;
 * semantic validation happens when the seed is saved to the store.
 */
class PolicyLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PolicySeed seed;

        static LoadResult ok(PolicySeed s) {
            LoadResult result;
            result.success = true;
            result.seed = std::move(s);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace rlsengine

#pragma once

#include "core/error.hpp"
#include "policy/policy_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rlsengine {

struct PolicyTemplate {
    std::string id;
    std::string name;
    std::string description;
    ConditionGroup filter_group;
};

/**
 * @brief Parameters for instantiating a template as a policy
 */
struct TemplateApplication {
    std::string template_id;
    std::string table_name;
    std::optional<std::string> schema_name;
    std::optional<std::string> connection_id;
    std::vector<std::string> role_ids;
    std::optional<std::string> created_by;
};

/**
 * @brief Built-in starting points for common row filters
 *
 *   department_filter  department = user.department
 *   region_filter      region IN user.region
 *   owner_filter       owner_id = user.user_id
 *   team_hierarchy     team_id = user.team OR created_by = user.user_id
 */
class PolicyTemplates {
public:
    [[nodiscard]] static const std::vector<PolicyTemplate>& builtin();

    [[nodiscard]] static const PolicyTemplate* find(const std::string& template_id);

    /// New enabled policy with a fresh id and timestamps; NOT_FOUND for unknown templates
    [[nodiscard]] static Result<RlsPolicy> apply(const TemplateApplication& application);
};

} // namespace rlsengine

#include "policy/policy_templates.hpp"
#include "core/utils.hpp"

#include <format>

namespace rlsengine {

namespace {

RlsCondition dynamic_condition(std::string id, std::string column,
                               ConditionOperator op, BuiltinAttribute attribute) {
    return RlsCondition{
        .id = std::move(id),
        .column = std::move(column),
        .op = op,
        .source = DynamicValue{attribute},
    };
}

ConditionGroup single(std::string id, RlsCondition condition) {
    ConditionGroup group;
    group.id = std::move(id);
    group.conditions.push_back(std::move(condition));
    return group;
}

std::vector<PolicyTemplate> make_builtin() {
    std::vector<PolicyTemplate> templates;

    templates.push_back({
        "department_filter", "Department Filter",
        "Users can only see data for their department",
        single("dept_group", dynamic_condition("dept_cond", "department",
                                               ConditionOperator::EQUALS,
                                               BuiltinAttribute::DEPARTMENT)),
    });

    templates.push_back({
        "region_filter", "Region Filter",
        "Users can only see data for their region(s)",
        single("region_group", dynamic_condition("region_cond", "region",
                                                 ConditionOperator::IN,
                                                 BuiltinAttribute::REGION)),
    });

    templates.push_back({
        "owner_filter", "Owner Filter",
        "Users can only see records they own",
        single("owner_group", dynamic_condition("owner_cond", "owner_id",
                                                ConditionOperator::EQUALS,
                                                BuiltinAttribute::USER_ID)),
    });

    ConditionGroup team;
    team.id = "team_group";
    team.logic = GroupLogic::OR;
    team.conditions.push_back(dynamic_condition("team_cond", "team_id",
                                                ConditionOperator::EQUALS, BuiltinAttribute::TEAM));
    team.conditions.push_back(dynamic_condition("owner_cond", "created_by",
                                                ConditionOperator::EQUALS, BuiltinAttribute::USER_ID));
    templates.push_back({
        "team_hierarchy", "Team Hierarchy",
        "Users can see their team's data and subordinates",
        std::move(team),
    });

    return templates;
}

} // anonymous namespace

const std::vector<PolicyTemplate>& PolicyTemplates::builtin() {
    static const std::vector<PolicyTemplate> templates = make_builtin();
    return templates;
}

const PolicyTemplate* PolicyTemplates::find(const std::string& template_id) {
    for (const auto& t : builtin()) {
        if (t.id == template_id) return &t;
    }
    return nullptr;
}

Result<RlsPolicy> PolicyTemplates::apply(const TemplateApplication& application) {
    const auto* tmpl = find(application.template_id);
    if (!tmpl) {
        return Result<RlsPolicy>::error(ErrorCategory::NOT_FOUND,
            std::format("template '{}' not found", application.template_id));
    }
    if (application.table_name.empty()) {
        return Result<RlsPolicy>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("template '{}': table name is required", tmpl->id));
    }

    const auto ts = utils::format_timestamp(utils::now());

    RlsPolicy policy;
    policy.id = utils::generate_uuid();
    policy.name = std::format("{} - {}", tmpl->name, application.table_name);
    policy.description = tmpl->description;
    policy.enabled = true;
    policy.schema_name = application.schema_name;
    policy.table_name = application.table_name;
    policy.connection_id = application.connection_id;
    policy.filter_group = tmpl->filter_group;
    policy.role_ids = application.role_ids;
    policy.created_at = ts;
    policy.updated_at = ts;
    policy.created_by = application.created_by;
    return Result<RlsPolicy>::ok(std::move(policy));
}

} // namespace rlsengine

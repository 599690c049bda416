#include "policy/policy_types.hpp"

#include <array>
#include <utility>

namespace rlsengine {

namespace {

constexpr std::array<std::pair<ConditionOperator, std::string_view>, 11> kOperators = {{
    {ConditionOperator::EQUALS,       "equals"},
    {ConditionOperator::NOT_EQUALS,   "not_equals"},
    {ConditionOperator::IN,           "in"},
    {ConditionOperator::NOT_IN,       "not_in"},
    {ConditionOperator::CONTAINS,     "contains"},
    {ConditionOperator::STARTS_WITH,  "starts_with"},
    {ConditionOperator::GREATER_THAN, "greater_than"},
    {ConditionOperator::LESS_THAN,    "less_than"},
    {ConditionOperator::BETWEEN,      "between"},
    {ConditionOperator::IS_NULL,      "is_null"},
    {ConditionOperator::IS_NOT_NULL,  "is_not_null"},
}};

constexpr std::array<std::pair<BuiltinAttribute, std::string_view>, 7> kAttributes = {{
    {BuiltinAttribute::USER_ID,    "user_id"},
    {BuiltinAttribute::USERNAME,   "username"},
    {BuiltinAttribute::EMAIL,      "email"},
    {BuiltinAttribute::DEPARTMENT, "department"},
    {BuiltinAttribute::REGION,     "region"},
    {BuiltinAttribute::ROLE,       "role"},
    {BuiltinAttribute::TEAM,       "team"},
}};

} // anonymous namespace

std::string_view operator_to_string(ConditionOperator op) {
    for (const auto& [value, name] : kOperators) {
        if (value == op) return name;
    }
    return "unknown";
}

std::optional<ConditionOperator> parse_operator(std::string_view s) {
    for (const auto& [value, name] : kOperators) {
        if (name == s) return value;
    }
    return std::nullopt;
}

std::string_view filter_type_to_string(FilterType type) {
    switch (type) {
        case FilterType::STATIC:     return "static";
        case FilterType::DYNAMIC:    return "dynamic";
        case FilterType::EXPRESSION: return "expression";
    }
    return "unknown";
}

std::optional<FilterType> parse_filter_type(std::string_view s) {
    if (s == "static") return FilterType::STATIC;
    if (s == "dynamic") return FilterType::DYNAMIC;
    if (s == "expression") return FilterType::EXPRESSION;
    return std::nullopt;
}

std::string_view group_logic_to_string(GroupLogic logic) {
    return logic == GroupLogic::AND ? "AND" : "OR";
}

std::optional<GroupLogic> parse_group_logic(std::string_view s) {
    if (s == "AND" || s == "and") return GroupLogic::AND;
    if (s == "OR" || s == "or") return GroupLogic::OR;
    return std::nullopt;
}

std::string_view builtin_attribute_to_string(BuiltinAttribute attr) {
    for (const auto& [value, name] : kAttributes) {
        if (value == attr) return name;
    }
    return "unknown";
}

std::optional<BuiltinAttribute> parse_builtin_attribute(std::string_view s) {
    for (const auto& [value, name] : kAttributes) {
        if (name == s) return value;
    }
    return std::nullopt;
}

} // namespace rlsengine

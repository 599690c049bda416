#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rlsengine {

// ============================================================================
// Security Roles
// ============================================================================

struct SecurityRole {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    bool is_default = false;                // Assigned to new users by the auth layer
    std::optional<int> priority;

    bool operator==(const SecurityRole&) const = default;
};

// ============================================================================
// Condition Language
// ============================================================================

enum class ConditionOperator {
    EQUALS,
    NOT_EQUALS,
    IN,
    NOT_IN,
    CONTAINS,
    STARTS_WITH,
    GREATER_THAN,
    LESS_THAN,
    BETWEEN,
    IS_NULL,
    IS_NOT_NULL
};

enum class FilterType {
    STATIC,
    DYNAMIC,
    EXPRESSION
};

enum class GroupLogic {
    AND,
    OR
};

/// Built-in user attributes. `custom` is modelled by CustomAttribute.
enum class BuiltinAttribute {
    USER_ID,
    USERNAME,
    EMAIL,
    DEPARTMENT,
    REGION,
    ROLE,
    TEAM
};

struct CustomAttribute {
    std::string name;

    bool operator==(const CustomAttribute&) const = default;
};

using AttributeRef = std::variant<BuiltinAttribute, CustomAttribute>;

// Value sources: exactly one per condition, the alternative is the filter type.
struct StaticValue {
    AttributeValue value;

    bool operator==(const StaticValue&) const = default;
};

struct DynamicValue {
    AttributeRef attribute;

    bool operator==(const DynamicValue&) const = default;
};

struct ExpressionValue {
    std::string sql;        // Trusted, administrator-authored fragment

    bool operator==(const ExpressionValue&) const = default;
};

using ValueSource = std::variant<StaticValue, DynamicValue, ExpressionValue>;

struct RlsCondition {
    std::string id;
    std::string column;
    ConditionOperator op = ConditionOperator::EQUALS;
    ValueSource source = StaticValue{};

    FilterType filter_type() const {
        return static_cast<FilterType>(source.index());
    }

    bool operator==(const RlsCondition&) const = default;
};

struct ConditionGroup {
    std::string id;
    GroupLogic logic = GroupLogic::AND;
    std::vector<RlsCondition> conditions;
    std::vector<ConditionGroup> groups;

    bool empty() const { return conditions.empty() && groups.empty(); }

    bool operator==(const ConditionGroup&) const = default;
};

// ============================================================================
// Policies & Configuration
// ============================================================================

struct RlsPolicy {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    bool enabled = true;
    std::optional<int> priority;

    // Scope (absent = any)
    std::optional<std::string> schema_name;
    std::optional<std::string> table_name;
    std::optional<std::string> connection_id;

    ConditionGroup filter_group;
    std::vector<std::string> role_ids;      // Empty = every role

    // Metadata
    std::optional<std::string> created_at;
    std::optional<std::string> updated_at;
    std::optional<std::string> created_by;

    int effective_priority() const { return priority.value_or(0); }

    bool operator==(const RlsPolicy&) const = default;
};

struct RlsConfiguration {
    bool enabled = true;
    bool default_deny = false;
    int cache_ttl_seconds = 300;
    bool log_access = true;
    bool audit_mode = false;

    bool operator==(const RlsConfiguration&) const = default;
};

// ============================================================================
// Enum <-> wire string helpers
// ============================================================================

[[nodiscard]] std::string_view operator_to_string(ConditionOperator op);
[[nodiscard]] std::optional<ConditionOperator> parse_operator(std::string_view s);

[[nodiscard]] std::string_view filter_type_to_string(FilterType type);
[[nodiscard]] std::optional<FilterType> parse_filter_type(std::string_view s);

[[nodiscard]] std::string_view group_logic_to_string(GroupLogic logic);
[[nodiscard]] std::optional<GroupLogic> parse_group_logic(std::string_view s);

[[nodiscard]] std::string_view builtin_attribute_to_string(BuiltinAttribute attr);
[[nodiscard]] std::optional<BuiltinAttribute> parse_builtin_attribute(std::string_view s);

/// Operators that ignore the right-hand value
[[nodiscard]] inline bool is_null_check(ConditionOperator op) {
    return op == ConditionOperator::IS_NULL || op == ConditionOperator::IS_NOT_NULL;
}

} // namespace rlsengine

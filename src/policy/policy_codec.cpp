#include "policy/policy_codec.hpp"
#include "policy/policy_constants.hpp"

#include <cstdint>
#include <format>
#include <limits>

namespace rlsengine {

using json = nlohmann::json;

std::string dump_json(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// Field helpers
// ============================================================================

namespace {

const json* find_field(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

void require_object(const json& j, std::string_view what) {
    if (!j.is_object()) {
        throw PolicyCodecError(std::format("{}: expected a JSON object", what));
    }
}

std::string require_string(const json& j, const char* key, std::string_view what) {
    const auto* field = find_field(j, key);
    if (!field || !field->is_string()) {
        throw PolicyCodecError(std::format("{}: '{}' must be a string", what, key));
    }
    return field->get<std::string>();
}

std::optional<std::string> optional_string(const json& j, const char* key, std::string_view what) {
    const auto* field = find_field(j, key);
    if (!field) return std::nullopt;
    if (!field->is_string()) {
        throw PolicyCodecError(std::format("{}: '{}' must be a string", what, key));
    }
    return field->get<std::string>();
}

std::optional<int> optional_int(const json& j, const char* key, std::string_view what) {
    const auto* field = find_field(j, key);
    if (!field) return std::nullopt;
    if (!field->is_number_integer()) {
        throw PolicyCodecError(std::format("{}: '{}' must be an integer", what, key));
    }
    const bool in_range = field->is_number_unsigned()
        ? field->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : (field->get<int64_t>() >= std::numeric_limits<int>::min() &&
           field->get<int64_t>() <= std::numeric_limits<int>::max());
    if (!in_range) {
        throw PolicyCodecError(std::format("{}: '{}' is out of range ({})", what, key, field->dump()));
    }
    return field->get<int>();
}

bool bool_or(const json& j, const char* key, bool fallback, std::string_view what) {
    const auto* field = find_field(j, key);
    if (!field) return fallback;
    if (!field->is_boolean()) {
        throw PolicyCodecError(std::format("{}: '{}' must be a boolean", what, key));
    }
    return field->get<bool>();
}

std::vector<std::string> string_array(const json& j, const char* key, std::string_view what) {
    std::vector<std::string> result;
    const auto* field = find_field(j, key);
    if (!field) return result;
    if (!field->is_array()) {
        throw PolicyCodecError(std::format("{}: '{}' must be an array", what, key));
    }
    for (const auto& item : *field) {
        if (!item.is_string()) {
            throw PolicyCodecError(std::format("{}: '{}' must contain strings", what, key));
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

const json* optional_array(const json& j, const char* key, std::string_view what) {
    const auto* field = find_field(j, key);
    if (field && !field->is_array()) {
        throw PolicyCodecError(std::format("{}: '{}' must be an array", what, key));
    }
    return field;
}

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) j[key] = *value;
}

} // anonymous namespace

// ============================================================================
// SecurityRole
// ============================================================================

void to_json(json& j, const SecurityRole& role) {
    j = json{{"id", role.id}, {"name", role.name}, {"isDefault", role.is_default}};
    put_optional(j, "description", role.description);
    if (role.priority) j["priority"] = *role.priority;
}

void from_json(const json& j, SecurityRole& role) {
    require_object(j, "role");
    role.id = require_string(j, "id", "role");
    const auto what = std::format("role '{}'", role.id);
    role.name = require_string(j, "name", what);
    role.description = optional_string(j, "description", what);
    role.is_default = bool_or(j, "isDefault", false, what);
    role.priority = optional_int(j, "priority", what);
}

// ============================================================================
// Conditions
// ============================================================================

void to_json(json& j, const RlsCondition& condition) {
    j = json{
        {"id", condition.id},
        {"column", condition.column},
        {"operator", operator_to_string(condition.op)},
        {"filterType", filter_type_to_string(condition.filter_type())},
    };

    if (const auto* s = std::get_if<StaticValue>(&condition.source)) {
        j["value"] = s->value;
    } else if (const auto* d = std::get_if<DynamicValue>(&condition.source)) {
        if (const auto* custom = std::get_if<CustomAttribute>(&d->attribute)) {
            j["userAttribute"] = policy::kCustomAttribute;
            j["customAttribute"] = custom->name;
        } else {
            j["userAttribute"] = builtin_attribute_to_string(std::get<BuiltinAttribute>(d->attribute));
        }
    } else {
        j["expression"] = std::get<ExpressionValue>(condition.source).sql;
    }
}

void from_json(const json& j, RlsCondition& condition) {
    require_object(j, "condition");
    condition.id = require_string(j, "id", "condition");
    const auto what = std::format("condition '{}'", condition.id);
    condition.column = optional_string(j, "column", what).value_or("");

    const auto op_name = require_string(j, "operator", what);
    const auto op = parse_operator(op_name);
    if (!op) {
        throw PolicyCodecError(std::format("{}: unknown operator '{}'", what, op_name));
    }
    condition.op = *op;

    const auto type_name = require_string(j, "filterType", what);
    const auto type = parse_filter_type(type_name);
    if (!type) {
        throw PolicyCodecError(std::format("{}: unknown filterType '{}'", what, type_name));
    }

    switch (*type) {
        case FilterType::STATIC: {
            const auto it = j.find("value");
            condition.source = StaticValue{it == j.end() ? json(nullptr) : *it};
            break;
        }
        case FilterType::DYNAMIC: {
            const auto attr_name = require_string(j, "userAttribute", what);
            if (attr_name == policy::kCustomAttribute) {
                condition.source = DynamicValue{
                    CustomAttribute{optional_string(j, "customAttribute", what).value_or("")}};
                break;
            }
            const auto attr = parse_builtin_attribute(attr_name);
            if (!attr) {
                throw PolicyCodecError(std::format("{}: unknown userAttribute '{}'", what, attr_name));
            }
            condition.source = DynamicValue{*attr};
            break;
        }
        case FilterType::EXPRESSION:
            condition.source = ExpressionValue{require_string(j, "expression", what)};
            break;
    }
}

void to_json(json& j, const ConditionGroup& group) {
    j = json{
        {"id", group.id},
        {"logic", group_logic_to_string(group.logic)},
        {"conditions", group.conditions},
        {"groups", group.groups},
    };
}

void from_json(const json& j, ConditionGroup& group) {
    require_object(j, "condition group");
    group.id = require_string(j, "id", "condition group");
    const auto what = std::format("condition group '{}'", group.id);

    const auto logic_name = optional_string(j, "logic", what).value_or("AND");
    const auto logic = parse_group_logic(logic_name);
    if (!logic) {
        throw PolicyCodecError(std::format("{}: unknown logic '{}'", what, logic_name));
    }
    group.logic = *logic;

    group.conditions.clear();
    if (const auto* conditions = optional_array(j, "conditions", what)) {
        for (const auto& item : *conditions) {
            group.conditions.push_back(item.get<RlsCondition>());
        }
    }

    group.groups.clear();
    if (const auto* groups = optional_array(j, "groups", what)) {
        for (const auto& item : *groups) {
            group.groups.push_back(item.get<ConditionGroup>());
        }
    }
}

// ============================================================================
// Policies & Configuration
// ============================================================================

void to_json(json& j, const RlsPolicy& policy) {
    j = json{
        {"id", policy.id},
        {"name", policy.name},
        {"enabled", policy.enabled},
        {"filterGroup", policy.filter_group},
        {"roleIds", policy.role_ids},
    };
    put_optional(j, "description", policy.description);
    if (policy.priority) j["priority"] = *policy.priority;
    put_optional(j, "schemaName", policy.schema_name);
    put_optional(j, "tableName", policy.table_name);
    put_optional(j, "connectionId", policy.connection_id);
    put_optional(j, "createdAt", policy.created_at);
    put_optional(j, "updatedAt", policy.updated_at);
    put_optional(j, "createdBy", policy.created_by);
}

void from_json(const json& j, RlsPolicy& policy) {
    require_object(j, "policy");
    policy.id = require_string(j, "id", "policy");
    const auto what = std::format("policy '{}'", policy.id);

    policy.name = require_string(j, "name", what);
    policy.description = optional_string(j, "description", what);
    policy.enabled = bool_or(j, "enabled", true, what);
    policy.priority = optional_int(j, "priority", what);
    policy.schema_name = optional_string(j, "schemaName", what);
    policy.table_name = optional_string(j, "tableName", what);
    policy.connection_id = optional_string(j, "connectionId", what);
    policy.role_ids = string_array(j, "roleIds", what);
    policy.created_at = optional_string(j, "createdAt", what);
    policy.updated_at = optional_string(j, "updatedAt", what);
    policy.created_by = optional_string(j, "createdBy", what);

    const auto* group = find_field(j, "filterGroup");
    if (!group) {
        throw PolicyCodecError(std::format("{}: 'filterGroup' is required", what));
    }
    policy.filter_group = group->get<ConditionGroup>();
}

void to_json(json& j, const RlsConfiguration& config) {
    j = json{
        {"enabled", config.enabled},
        {"defaultDeny", config.default_deny},
        {"cacheTtlSeconds", config.cache_ttl_seconds},
        {"logAccess", config.log_access},
        {"auditMode", config.audit_mode},
    };
}

void from_json(const json& j, RlsConfiguration& config) {
    require_object(j, "configuration");
    const RlsConfiguration defaults;
    config.enabled = bool_or(j, "enabled", defaults.enabled, "configuration");
    config.default_deny = bool_or(j, "defaultDeny", defaults.default_deny, "configuration");
    config.cache_ttl_seconds = optional_int(j, "cacheTtlSeconds", "configuration")
                                   .value_or(defaults.cache_ttl_seconds);
    config.log_access = bool_or(j, "logAccess", defaults.log_access, "configuration");
    config.audit_mode = bool_or(j, "auditMode", defaults.audit_mode, "configuration");
}

// ============================================================================
// Decisions & Requests
// ============================================================================

void to_json(json& j, const FilterDecision& decision) {
    j = json{
        {"hasFilters", decision.has_filters},
        {"policiesApplied", decision.policies_applied},
        {"accessDenied", decision.access_denied},
    };
    put_optional(j, "whereClause", decision.where_clause);
    put_optional(j, "denialReason", decision.denial_reason);
}

void from_json(const json& j, FilterDecision& decision) {
    require_object(j, "decision");
    decision.has_filters = bool_or(j, "hasFilters", false, "decision");
    decision.where_clause = optional_string(j, "whereClause", "decision");
    decision.policies_applied = string_array(j, "policiesApplied", "decision");
    decision.access_denied = bool_or(j, "accessDenied", false, "decision");
    decision.denial_reason = optional_string(j, "denialReason", "decision");
}

void to_json(json& j, const UserSecurityContext& user) {
    j = json{
        {"userId", user.user_id},
        {"username", user.username},
        {"roles", user.sorted_roles()},
        {"attributes", json::object()},
    };
    put_optional(j, "email", user.email);
    for (const auto& [name, value] : user.attributes) {
        j["attributes"][name] = value;
    }
}

void from_json(const json& j, UserSecurityContext& user) {
    require_object(j, "userContext");
    user.user_id = require_string(j, "userId", "userContext");
    user.username = optional_string(j, "username", "userContext").value_or("");
    user.email = optional_string(j, "email", "userContext");

    user.roles.clear();
    for (auto& role : string_array(j, "roles", "userContext")) {
        user.roles.insert(std::move(role));
    }

    user.attributes.clear();
    if (const auto* attributes = find_field(j, "attributes")) {
        if (!attributes->is_object()) {
            throw PolicyCodecError("userContext: 'attributes' must be an object");
        }
        for (const auto& [name, value] : attributes->items()) {
            user.attributes[name] = value;
        }
    }
}

void from_json(const json& j, EvaluationRequest& request) {
    require_object(j, "request");
    request.table.connection_id = optional_string(j, "connectionId", "request").value_or("");
    request.table.schema = optional_string(j, "schemaName", "request")
                               .value_or(std::string(policy::kDefaultSchema));
    request.table.table = require_string(j, "tableName", "request");

    const auto* user = find_field(j, "userContext");
    if (!user) {
        throw PolicyCodecError("request: 'userContext' is required");
    }
    request.user = user->get<UserSecurityContext>();
}

nlohmann::json parse_json(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw PolicyCodecError(std::format("invalid JSON: {}", e.what()));
    }
}

} // namespace rlsengine

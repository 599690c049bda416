#include "policy/policy_loader.hpp"
#include "policy/policy_constants.hpp"
#include "core/utils.hpp"

#include <toml.hpp>
#include <format>
#include <fstream>
#include <stdexcept>

using namespace std::string_literals;

namespace rlsengine {

// Seed file keys
static constexpr std::string_view kRoles       = "roles";
static constexpr std::string_view kPolicies    = "policies";
static constexpr std::string_view kFilterGroup = "filter_group";
static constexpr std::string_view kConditions  = "conditions";
static constexpr std::string_view kGroups      = "groups";

// ============================================================================
// TOML -> model helpers (throw std::runtime_error, caught in load_from_string)
// ============================================================================

namespace {

std::string require_string(const toml::table& tbl, std::string_view key, const std::string& where) {
    auto v = tbl[key].value<std::string>();
    if (!v || v->empty()) {
        throw std::runtime_error(std::format("{}: '{}' is required", where, key));
    }
    return *v;
}

std::optional<std::string> optional_string(const toml::table& tbl, std::string_view key) {
    return tbl[key].value<std::string>();
}

std::vector<std::string> string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> out;
    const auto* arr = tbl[key].as_array();
    if (!arr) return out;
    for (const auto& elem : *arr) {
        if (const auto* s = elem.as_string(); s && !s->get().empty()) {
            out.emplace_back(s->get());
        }
    }
    return out;
}

AttributeValue to_attribute_value(const toml::node& node, const std::string& where) {
    if (const auto* s = node.as_string()) return AttributeValue(s->get());
    if (const auto* i = node.as_integer()) return AttributeValue(i->get());
    if (const auto* f = node.as_floating_point()) return AttributeValue(f->get());
    if (const auto* b = node.as_boolean()) return AttributeValue(b->get());
    if (const auto* arr = node.as_array()) {
        AttributeValue out = AttributeValue::array();
        for (const auto& elem : *arr) {
            out.push_back(to_attribute_value(elem, where));
        }
        return out;
    }
    throw std::runtime_error(std::format("{}: unsupported value type", where));
}

RlsCondition parse_condition(const toml::table& tbl, const std::string& where) {
    RlsCondition condition;
    condition.id = require_string(tbl, "id", where);
    const auto here = std::format("{} condition '{}'", where, condition.id);
    condition.column = tbl["column"].value_or(""s);

    const std::string op_name = utils::to_lower(tbl["operator"].value_or("equals"s));
    const auto op = parse_operator(op_name);
    if (!op) {
        throw std::runtime_error(std::format("{}: invalid operator '{}'", here, op_name));
    }
    condition.op = *op;

    const auto expression = optional_string(tbl, "expression");
    const auto attribute = optional_string(tbl, "user_attribute");

    FilterType type = expression ? FilterType::EXPRESSION
                    : attribute  ? FilterType::DYNAMIC
                                 : FilterType::STATIC;
    if (const auto type_name = optional_string(tbl, "filter_type")) {
        const auto parsed = parse_filter_type(utils::to_lower(*type_name));
        if (!parsed) {
            throw std::runtime_error(std::format("{}: invalid filter_type '{}'", here, *type_name));
        }
        type = *parsed;
    }

    switch (type) {
        case FilterType::STATIC: {
            const auto* value = tbl.get("value");
            condition.source = StaticValue{value ? to_attribute_value(*value, here) : AttributeValue()};
            break;
        }
        case FilterType::DYNAMIC: {
            if (!attribute) {
                throw std::runtime_error(std::format("{}: dynamic condition needs user_attribute", here));
            }
            if (*attribute == policy::kCustomAttribute) {
                condition.source = DynamicValue{CustomAttribute{tbl["custom_attribute"].value_or(""s)}};
                break;
            }
            const auto builtin = parse_builtin_attribute(*attribute);
            if (!builtin) {
                throw std::runtime_error(std::format("{}: invalid user_attribute '{}'", here, *attribute));
            }
            condition.source = DynamicValue{*builtin};
            break;
        }
        case FilterType::EXPRESSION:
            if (!expression) {
                throw std::runtime_error(std::format("{}: expression condition needs expression", here));
            }
            condition.source = ExpressionValue{*expression};
            break;
    }
    return condition;
}

ConditionGroup parse_group(const toml::table& tbl, const std::string& where) {
    ConditionGroup group;
    group.id = require_string(tbl, "id", where + " filter group");
    const auto here = std::format("{} group '{}'", where, group.id);

    const std::string logic_name = tbl["logic"].value_or("AND"s);
    const auto logic = parse_group_logic(logic_name);
    if (!logic) {
        throw std::runtime_error(std::format("{}: invalid logic '{}'", here, logic_name));
    }
    group.logic = *logic;

    if (const auto* arr = tbl[kConditions].as_array()) {
        for (const auto& elem : *arr) {
            const auto* node = elem.as_table();
            if (!node) throw std::runtime_error(std::format("{}: conditions must be tables", here));
            group.conditions.push_back(parse_condition(*node, here));
        }
    }
    if (const auto* arr = tbl[kGroups].as_array()) {
        for (const auto& elem : *arr) {
            const auto* node = elem.as_table();
            if (!node) throw std::runtime_error(std::format("{}: groups must be tables", here));
            group.groups.push_back(parse_group(*node, here));
        }
    }
    return group;
}

SecurityRole parse_role(const toml::table& tbl) {
    SecurityRole role;
    role.id = require_string(tbl, "id", "Role");
    role.name = tbl["name"].value_or(role.id);
    role.description = optional_string(tbl, "description");
    role.is_default = tbl["is_default"].value_or(false);
    if (auto p = tbl["priority"].value<int>()) role.priority = *p;
    return role;
}

RlsPolicy parse_policy(const toml::table& tbl) {
    RlsPolicy policy;
    policy.id = require_string(tbl, "id", "Policy");
    const auto where = std::format("Policy '{}'", policy.id);

    policy.name = tbl["name"].value_or(policy.id);
    policy.description = optional_string(tbl, "description");
    policy.enabled = tbl["enabled"].value_or(true);
    if (auto p = tbl["priority"].value<int>()) policy.priority = *p;

    policy.connection_id = optional_string(tbl, "connection");
    policy.schema_name = optional_string(tbl, "schema");
    policy.table_name = optional_string(tbl, "table");
    policy.role_ids = string_array(tbl, kRoles);
    policy.created_by = optional_string(tbl, "created_by");

    const auto* group = tbl[kFilterGroup].as_table();
    if (!group) {
        throw std::runtime_error(std::format("{}: [policies.filter_group] is required", where));
    }
    policy.filter_group = parse_group(*group, where);
    return policy;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open policy file: {}", path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

PolicyLoader::LoadResult PolicyLoader::load_from_string(const std::string& toml_content) {
    PolicySeed seed;

    try {
        auto root = toml::parse(toml_content);

        if (const auto* roles = root[kRoles].as_array()) {
            for (const auto& elem : *roles) {
                const auto* node = elem.as_table();
                if (!node) continue;
                seed.roles.push_back(parse_role(*node));
            }
        }

        if (const auto* policies = root[kPolicies].as_array()) {
            for (const auto& elem : *policies) {
                const auto* node = elem.as_table();
                if (!node) continue;
                seed.policies.push_back(parse_policy(*node));
            }
        }

        return LoadResult::ok(std::move(seed));

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Error parsing policies: {}", e.what()));
    }
}

} // namespace rlsengine

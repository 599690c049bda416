#include "policy/policy_validator.hpp"
#include "policy/condition_compiler.hpp"
#include "policy/policy_codec.hpp"
#include "core/utils.hpp"

#include <format>

namespace rlsengine {

namespace {

Result<Done> invalid(std::string message) {
    return Result<Done>::error(ErrorCategory::VALIDATION_ERROR, std::move(message));
}

} // anonymous namespace

Result<Done> PolicyValidator::validate_policy(
    const RlsPolicy& policy,
    const std::unordered_set<std::string>& known_role_ids) {

    if (policy.id.empty()) return invalid("policy id is required");
    if (utils::trim(policy.name).empty()) {
        return invalid(std::format("policy '{}': name is required", policy.id));
    }

    for (const auto& role_id : policy.role_ids) {
        if (!known_role_ids.contains(role_id)) {
            return invalid(std::format("policy '{}': unknown role id '{}'", policy.id, role_id));
        }
    }

    auto group_result = validate_group(policy.filter_group);
    if (group_result.is_error()) {
        return invalid(std::format("policy '{}': {}", policy.id, group_result.error_message()));
    }
    return Result<Done>::ok({});
}

Result<Done> PolicyValidator::validate_group(const ConditionGroup& group) {
    if (group.id.empty()) return invalid("condition group id is required");

    for (const auto& condition : group.conditions) {
        auto r = validate_condition(condition);
        if (r.is_error()) return r;
    }
    for (const auto& nested : group.groups) {
        auto r = validate_group(nested);
        if (r.is_error()) return r;
    }
    return Result<Done>::ok({});
}

Result<Done> PolicyValidator::validate_condition(const RlsCondition& condition) {
    if (condition.id.empty()) return invalid("condition id is required");

    if (const auto* expr = std::get_if<ExpressionValue>(&condition.source)) {
        if (utils::trim(expr->sql).empty()) {
            return invalid(std::format("condition '{}': expression is empty", condition.id));
        }
        return Result<Done>::ok({});
    }

    if (utils::trim(condition.column).empty()) {
        return invalid(std::format("condition '{}': column is required", condition.id));
    }

    if (const auto* dyn = std::get_if<DynamicValue>(&condition.source)) {
        const auto* custom = std::get_if<CustomAttribute>(&dyn->attribute);
        if (custom && custom->name.empty()) {
            return invalid(std::format(
                "condition '{}': custom attribute requires a name", condition.id));
        }
        return Result<Done>::ok({});
    }

    if (is_null_check(condition.op)) return Result<Done>::ok({});

    const auto& value = std::get<StaticValue>(condition.source).value;
    if (!ConditionCompiler::operand_fits(condition.op, value)) {
        return invalid(std::format("condition '{}': value {} does not fit operator '{}'",
                                   condition.id, dump_json(value), operator_to_string(condition.op)));
    }
    return Result<Done>::ok({});
}

Result<Done> PolicyValidator::validate_role(const SecurityRole& role) {
    if (role.id.empty()) return invalid("role id is required");
    if (utils::trim(role.name).empty()) {
        return invalid(std::format("role '{}': name is required", role.id));
    }
    return Result<Done>::ok({});
}

Result<Done> PolicyValidator::validate_config(const RlsConfiguration& config) {
    if (config.cache_ttl_seconds < 0) {
        return invalid(std::format("cache_ttl_seconds must be >= 0 (got {})",
                                   config.cache_ttl_seconds));
    }
    return Result<Done>::ok({});
}

} // namespace rlsengine

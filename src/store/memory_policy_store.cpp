#include "store/memory_policy_store.hpp"
#include "policy/policy_validator.hpp"
#include "core/utils.hpp"

#include <format>

namespace rlsengine {

namespace {

std::string now_string() {
    return utils::format_timestamp(utils::now());
}

} // anonymous namespace

// ============================================================================
// Reads
// ============================================================================

Result<std::vector<RlsPolicy>> MemoryPolicyStore::list_policies() {
    std::lock_guard lock(mutex_);
    std::vector<RlsPolicy> result;
    result.reserve(policies_.size());
    for (const auto& [id, policy] : policies_) {
        result.push_back(policy);
    }
    return Result<std::vector<RlsPolicy>>::ok(std::move(result));
}

Result<std::vector<SecurityRole>> MemoryPolicyStore::list_roles() {
    std::lock_guard lock(mutex_);
    std::vector<SecurityRole> result;
    result.reserve(roles_.size());
    for (const auto& [id, role] : roles_) {
        result.push_back(role);
    }
    return Result<std::vector<SecurityRole>>::ok(std::move(result));
}

Result<RlsConfiguration> MemoryPolicyStore::get_config() {
    std::lock_guard lock(mutex_);
    return Result<RlsConfiguration>::ok(config_);
}

void MemoryPolicyStore::subscribe(ChangeCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

// ============================================================================
// Policies
// ============================================================================

Result<RlsPolicy> MemoryPolicyStore::create_policy(RlsPolicy policy) {
    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        if (policies_.contains(policy.id)) {
            return Result<RlsPolicy>::error(ErrorCategory::CONFLICT,
                std::format("policy '{}' already exists", policy.id));
        }
        auto valid = PolicyValidator::validate_policy(policy, role_ids_locked());
        if (valid.is_error()) {
            return Result<RlsPolicy>::error(valid.error_category(), valid.error_message());
        }
        const auto ts = now_string();
        if (!policy.created_at) policy.created_at = ts;
        policy.updated_at = ts;
        policies_[policy.id] = policy;
        gen = bump_locked();
    }
    utils::log::info(std::format("Policy created: {} (generation {})", policy.id, gen));
    notify(gen);
    return Result<RlsPolicy>::ok(std::move(policy));
}

Result<RlsPolicy> MemoryPolicyStore::update_policy(RlsPolicy policy) {
    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        const auto it = policies_.find(policy.id);
        if (it == policies_.end()) {
            return Result<RlsPolicy>::error(ErrorCategory::NOT_FOUND,
                std::format("policy '{}' not found", policy.id));
        }
        auto valid = PolicyValidator::validate_policy(policy, role_ids_locked());
        if (valid.is_error()) {
            return Result<RlsPolicy>::error(valid.error_category(), valid.error_message());
        }
        policy.created_at = it->second.created_at;
        policy.created_by = it->second.created_by;
        policy.updated_at = now_string();
        it->second = policy;
        gen = bump_locked();
    }
    utils::log::info(std::format("Policy updated: {} (generation {})", policy.id, gen));
    notify(gen);
    return Result<RlsPolicy>::ok(std::move(policy));
}

Result<Done> MemoryPolicyStore::delete_policy(const std::string& policy_id) {
    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        if (policies_.erase(policy_id) == 0) {
            return Result<Done>::error(ErrorCategory::NOT_FOUND,
                std::format("policy '{}' not found", policy_id));
        }
        gen = bump_locked();
    }
    utils::log::info(std::format("Policy deleted: {} (generation {})", policy_id, gen));
    notify(gen);
    return Result<Done>::ok({});
}

Result<RlsPolicy> MemoryPolicyStore::toggle_policy(const std::string& policy_id, bool enabled) {
    uint64_t gen = 0;
    RlsPolicy updated;
    {
        std::lock_guard lock(mutex_);
        const auto it = policies_.find(policy_id);
        if (it == policies_.end()) {
            return Result<RlsPolicy>::error(ErrorCategory::NOT_FOUND,
                std::format("policy '{}' not found", policy_id));
        }
        it->second.enabled = enabled;
        it->second.updated_at = now_string();
        updated = it->second;
        gen = bump_locked();
    }
    utils::log::info(std::format("Policy {} {} (generation {})",
                                 policy_id, enabled ? "enabled" : "disabled", gen));
    notify(gen);
    return Result<RlsPolicy>::ok(std::move(updated));
}

// ============================================================================
// Roles
// ============================================================================

Result<SecurityRole> MemoryPolicyStore::create_role(SecurityRole role) {
    auto valid = PolicyValidator::validate_role(role);
    if (valid.is_error()) {
        return Result<SecurityRole>::error(valid.error_category(), valid.error_message());
    }

    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        if (roles_.contains(role.id)) {
            return Result<SecurityRole>::error(ErrorCategory::CONFLICT,
                std::format("role '{}' already exists", role.id));
        }
        roles_[role.id] = role;
        gen = bump_locked();
    }
    notify(gen);
    return Result<SecurityRole>::ok(std::move(role));
}

Result<SecurityRole> MemoryPolicyStore::update_role(SecurityRole role) {
    auto valid = PolicyValidator::validate_role(role);
    if (valid.is_error()) {
        return Result<SecurityRole>::error(valid.error_category(), valid.error_message());
    }

    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        const auto it = roles_.find(role.id);
        if (it == roles_.end()) {
            return Result<SecurityRole>::error(ErrorCategory::NOT_FOUND,
                std::format("role '{}' not found", role.id));
        }
        it->second = role;
        gen = bump_locked();
    }
    notify(gen);
    return Result<SecurityRole>::ok(std::move(role));
}

Result<Done> MemoryPolicyStore::delete_role(const std::string& role_id) {
    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        if (!roles_.contains(role_id)) {
            return Result<Done>::error(ErrorCategory::NOT_FOUND,
                std::format("role '{}' not found", role_id));
        }
        for (const auto& [id, policy] : policies_) {
            for (const auto& ref : policy.role_ids) {
                if (ref == role_id) {
                    return Result<Done>::error(ErrorCategory::CONFLICT,
                        std::format("role '{}' is referenced by policy '{}'", role_id, id));
                }
            }
        }
        roles_.erase(role_id);
        gen = bump_locked();
    }
    notify(gen);
    return Result<Done>::ok({});
}

// ============================================================================
// Configuration
// ============================================================================

Result<RlsConfiguration> MemoryPolicyStore::update_config(RlsConfiguration config) {
    auto valid = PolicyValidator::validate_config(config);
    if (valid.is_error()) {
        return Result<RlsConfiguration>::error(valid.error_category(), valid.error_message());
    }

    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        config_ = config;
        gen = bump_locked();
    }
    utils::log::info(std::format(
        "RLS configuration updated: enabled={} default_deny={} audit_mode={} (generation {})",
        utils::booltostr(config.enabled), utils::booltostr(config.default_deny),
        utils::booltostr(config.audit_mode), gen));
    notify(gen);
    return Result<RlsConfiguration>::ok(config);
}

Result<Done> MemoryPolicyStore::replace_all(
    std::vector<SecurityRole> roles,
    std::vector<RlsPolicy> policies,
    std::optional<RlsConfiguration> config) {

    std::unordered_set<std::string> role_ids;
    for (const auto& role : roles) {
        auto valid = PolicyValidator::validate_role(role);
        if (valid.is_error()) return valid;
        if (!role_ids.insert(role.id).second) {
            return Result<Done>::error(ErrorCategory::CONFLICT,
                std::format("duplicate role id '{}'", role.id));
        }
    }

    std::unordered_set<std::string> policy_ids;
    for (const auto& policy : policies) {
        auto valid = PolicyValidator::validate_policy(policy, role_ids);
        if (valid.is_error()) return valid;
        if (!policy_ids.insert(policy.id).second) {
            return Result<Done>::error(ErrorCategory::CONFLICT,
                std::format("duplicate policy id '{}'", policy.id));
        }
    }

    if (config) {
        auto valid = PolicyValidator::validate_config(*config);
        if (valid.is_error()) return valid;
    }

    uint64_t gen = 0;
    {
        std::lock_guard lock(mutex_);
        roles_.clear();
        for (auto& role : roles) {
            roles_[role.id] = std::move(role);
        }
        policies_.clear();
        for (auto& policy : policies) {
            policies_[policy.id] = std::move(policy);
        }
        if (config) config_ = *config;
        gen = bump_locked();
    }
    utils::log::info(std::format("Policy store replaced: {} roles, {} policies (generation {})",
                                 role_ids.size(), policy_ids.size(), gen));
    notify(gen);
    return Result<Done>::ok({});
}

// ============================================================================
// Internals
// ============================================================================

std::unordered_set<std::string> MemoryPolicyStore::role_ids_locked() const {
    std::unordered_set<std::string> ids;
    ids.reserve(roles_.size());
    for (const auto& [id, role] : roles_) {
        ids.insert(id);
    }
    return ids;
}

uint64_t MemoryPolicyStore::bump_locked() {
    return generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

void MemoryPolicyStore::notify(uint64_t generation) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(generation);
    }
}

} // namespace rlsengine

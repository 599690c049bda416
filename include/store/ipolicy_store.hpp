#pragma once

#include "core/error.hpp"
#include "policy/policy_types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace rlsengine {

/**
 * @brief Abstract keyed store of policies, roles and configuration
 *
 * Enables pluggable persistence - in-memory (MemoryPolicyStore), a
 * database-backed store, or a failing double for tests. Every successful
 * mutation bumps generation() and notifies subscribers.
 */
class IPolicyStore {
public:
    virtual ~IPolicyStore() = default;

    using ChangeCallback = std::function<void(uint64_t generation)>;

    // Reads
    [[nodiscard]] virtual Result<std::vector<RlsPolicy>> list_policies() = 0;
    [[nodiscard]] virtual Result<std::vector<SecurityRole>> list_roles() = 0;
    [[nodiscard]] virtual Result<RlsConfiguration> get_config() = 0;
    [[nodiscard]] virtual uint64_t generation() const = 0;

    virtual void subscribe(ChangeCallback callback) = 0;

    // Policy mutations
    [[nodiscard]] virtual Result<RlsPolicy> create_policy(RlsPolicy policy) = 0;
    [[nodiscard]] virtual Result<RlsPolicy> update_policy(RlsPolicy policy) = 0;
    [[nodiscard]] virtual Result<Done> delete_policy(const std::string& policy_id) = 0;
    [[nodiscard]] virtual Result<RlsPolicy> toggle_policy(const std::string& policy_id, bool enabled) = 0;

    // Role mutations
    [[nodiscard]] virtual Result<SecurityRole> create_role(SecurityRole role) = 0;
    [[nodiscard]] virtual Result<SecurityRole> update_role(SecurityRole role) = 0;
    [[nodiscard]] virtual Result<Done> delete_role(const std::string& role_id) = 0;

    [[nodiscard]] virtual Result<RlsConfiguration> update_config(RlsConfiguration config) = 0;
};

} // namespace rlsengine

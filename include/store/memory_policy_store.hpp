#pragma once

#include "store/ipolicy_store.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>

namespace rlsengine {

/**
 * @brief In-process IPolicyStore
 *
 * Mutations are validated with PolicyValidator before they are applied and
 * bump the generation by one. Subscribers are invoked after the lock is
 * released, so a callback may read back from the store.
 */
class MemoryPolicyStore : public IPolicyStore {
public:
    MemoryPolicyStore() = default;
    explicit MemoryPolicyStore(RlsConfiguration config) : config_(config) {}

    [[nodiscard]] Result<std::vector<RlsPolicy>> list_policies() override;
    [[nodiscard]] Result<std::vector<SecurityRole>> list_roles() override;
    [[nodiscard]] Result<RlsConfiguration> get_config() override;
    [[nodiscard]] uint64_t generation() const override {
        return generation_.load(std::memory_order_acquire);
    }

    void subscribe(ChangeCallback callback) override;

    [[nodiscard]] Result<RlsPolicy> create_policy(RlsPolicy policy) override;
    [[nodiscard]] Result<RlsPolicy> update_policy(RlsPolicy policy) override;
    [[nodiscard]] Result<Done> delete_policy(const std::string& policy_id) override;
    [[nodiscard]] Result<RlsPolicy> toggle_policy(const std::string& policy_id, bool enabled) override;

    [[nodiscard]] Result<SecurityRole> create_role(SecurityRole role) override;
    [[nodiscard]] Result<SecurityRole> update_role(SecurityRole role) override;
    [[nodiscard]] Result<Done> delete_role(const std::string& role_id) override;

    [[nodiscard]] Result<RlsConfiguration> update_config(RlsConfiguration config) override;

    /**
     * @brief Replace the whole content in one step (seed file load/reload)
     *
     * Validates everything first; on error nothing changes. Optional config
     * leaves the current configuration untouched.
     */
    [[nodiscard]] Result<Done> replace_all(
        std::vector<SecurityRole> roles,
        std::vector<RlsPolicy> policies,
        std::optional<RlsConfiguration> config = std::nullopt);

private:
    std::unordered_set<std::string> role_ids_locked() const;
    uint64_t bump_locked();
    void notify(uint64_t generation);

    mutable std::mutex mutex_;
    std::map<std::string, RlsPolicy> policies_;
    std::map<std::string, SecurityRole> roles_;
    RlsConfiguration config_;
    std::atomic<uint64_t> generation_{1};

    std::mutex callbacks_mutex_;
    std::vector<ChangeCallback> callbacks_;
};

} // namespace rlsengine

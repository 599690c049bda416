#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "engine/policy_snapshot.hpp"
#include "store/ipolicy_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace rlsengine {

/**
 * @brief Loads PolicySnapshots from an IPolicyStore and publishes them (RCU)
 *
 * - refresh(): read roles, policies, config and generation, retrying with
 *   exponential backoff; publish atomically on success.
 * - Store change notifications refresh synchronously on the notifying thread.
 * - start(): background thread refreshing every `interval` and invoking
 *   the tick callback (cache sweep).
 * - current(): the snapshot while the last refresh succeeded or it is within
 *   `max_staleness`; nullptr otherwise (callers fail closed).
 */
class SnapshotLoader {
public:
    using Clock = std::chrono::steady_clock;
    using TickCallback = std::function<void()>;

    SnapshotLoader(std::shared_ptr<IPolicyStore> store, const RefreshConfig& config);
    ~SnapshotLoader();

    SnapshotLoader(const SnapshotLoader&) = delete;
    SnapshotLoader& operator=(const SnapshotLoader&) = delete;

    /// Load and publish, retrying on store failure
    [[nodiscard]] Result<Done> refresh();

    /// Usable snapshot, or nullptr when none was loaded or it is too stale
    [[nodiscard]] std::shared_ptr<const PolicySnapshot> current(Clock::time_point now = Clock::now()) const;

    /// Last published snapshot regardless of staleness
    [[nodiscard]] std::shared_ptr<const PolicySnapshot> latest() const {
        return snapshot_.load(std::memory_order_acquire);
    }

    void start(TickCallback on_tick = {});
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] bool last_refresh_ok() const { return last_refresh_ok_.load(); }

    struct Stats {
        uint64_t refreshes;
        uint64_t failures;
        uint64_t retries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    /// Store subscription handle that outlives the loader safely
    struct Link {
        std::mutex mutex;
        SnapshotLoader* target = nullptr;
    };

    [[nodiscard]] Result<std::shared_ptr<const PolicySnapshot>> load_once();
    void refresh_loop(std::stop_token stop);

    std::shared_ptr<IPolicyStore> store_;
    RefreshConfig config_;
    std::shared_ptr<Link> link_;

    std::atomic<std::shared_ptr<const PolicySnapshot>> snapshot_;
    std::atomic<bool> last_refresh_ok_{false};
    std::mutex refresh_mutex_;

    TickCallback on_tick_;
    std::atomic<bool> running_{false};
    std::jthread refresh_thread_;

    std::atomic<uint64_t> refreshes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> retries_{0};
};

} // namespace rlsengine

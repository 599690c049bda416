#pragma once

#include "policy/policy_loader.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace rlsengine {

/**
 * @brief Polls a policy seed file and hands every successful reload to a callback
 *
 * Change detection is by modification time, which works on any filesystem.
 * A seed that fails to parse is logged and skipped; the previous content
 * stays in effect. The callback runs on the watcher thread.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(PolicySeed seed)>;

    explicit ConfigWatcher(
        std::string seed_path,
        std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();
    void stop();

    /// One poll step: reload if the mtime moved. Returns true if the callback ran.
    bool check_now();

    [[nodiscard]] bool is_running() const { return running_.load(); }

private:
    void watch_loop(std::stop_token stop);

    std::string seed_path_;
    std::chrono::seconds poll_interval_;
    ReloadCallback callback_;

    std::filesystem::file_time_type last_mtime_{};
    std::atomic<bool> running_{false};
    std::jthread watch_thread_;
};

} // namespace rlsengine

#include "config/config_watcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace rlsengine {

ConfigWatcher::ConfigWatcher(std::string seed_path, std::chrono::seconds poll_interval)
    : seed_path_(std::move(seed_path)),
      poll_interval_(poll_interval) {
    std::error_code ec;
    last_mtime_ = std::filesystem::last_write_time(seed_path_, ec);
    if (ec) {
        utils::log::warn(std::format("Seed watcher: cannot stat {}: {}", seed_path_, ec.message()));
    }
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::set_callback(ReloadCallback callback) {
    callback_ = std::move(callback);
}

void ConfigWatcher::start() {
    if (running_.load()) return;
    running_.store(true);
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
    utils::log::info(std::format("Seed watcher started: polling {} every {}s",
                                 seed_path_, poll_interval_.count()));
}

void ConfigWatcher::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    utils::log::info("Seed watcher stopped");
}

bool ConfigWatcher::check_now() {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(seed_path_, ec);
    if (ec) {
        utils::log::warn(std::format("Seed watcher: cannot stat {}: {}", seed_path_, ec.message()));
        return false;
    }
    if (mtime == last_mtime_) return false;
    last_mtime_ = mtime;

    utils::log::info(std::format("Seed file changed: {}", seed_path_));
    auto result = PolicyLoader::load_from_file(seed_path_);
    if (!result.success) {
        utils::log::error(std::format("Seed reload failed (keeping current policies): {}",
                                      result.error_message));
        return false;
    }

    if (!callback_) return false;
    try {
        callback_(std::move(result.seed));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Seed reload callback error: {}", e.what()));
        return false;
    }
    return true;
}

void ConfigWatcher::watch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in 100ms steps for responsive shutdown
        for (int i = 0; i < poll_interval_.count() * 10 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stop.stop_requested()) break;

        // Editors that write in place may leave a short incomplete window
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        (void)check_now();
    }
}

} // namespace rlsengine

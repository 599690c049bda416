#include "engine/snapshot_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace rlsengine {

SnapshotLoader::SnapshotLoader(std::shared_ptr<IPolicyStore> store, const RefreshConfig& config)
    : store_(std::move(store)),
      config_(config),
      link_(std::make_shared<Link>()) {

    link_->target = this;
    std::weak_ptr<Link> weak = link_;
    store_->subscribe([weak](uint64_t generation) {
        auto link = weak.lock();
        if (!link) return;
        std::lock_guard lock(link->mutex);
        if (!link->target) return;
        utils::log::debug(std::format("Store changed (generation {}), refreshing snapshot",
                                      generation));
        const auto result = link->target->refresh();
        if (result.is_error()) {
            utils::log::warn(std::format("Refresh after store change failed: {}",
                                         result.error_message()));
        }
    });
}

SnapshotLoader::~SnapshotLoader() {
    stop();
    std::lock_guard lock(link_->mutex);
    link_->target = nullptr;
}

// ============================================================================
// Refresh
// ============================================================================

Result<std::shared_ptr<const PolicySnapshot>> SnapshotLoader::load_once() {
    using SnapshotResult = Result<std::shared_ptr<const PolicySnapshot>>;

    const uint64_t gen_before = store_->generation();

    auto roles = store_->list_roles();
    if (roles.is_error()) {
        return SnapshotResult::error(roles.error_category(), roles.error_message());
    }
    auto policies = store_->list_policies();
    if (policies.is_error()) {
        return SnapshotResult::error(policies.error_category(), policies.error_message());
    }
    auto config = store_->get_config();
    if (config.is_error()) {
        return SnapshotResult::error(config.error_category(), config.error_message());
    }

    // A mutation between the reads would mix two generations
    const uint64_t gen_after = store_->generation();
    if (gen_before != gen_after) {
        return SnapshotResult::error(ErrorCategory::CONFLICT,
            std::format("store changed during load (generation {} -> {})", gen_before, gen_after));
    }

    auto snapshot = std::make_shared<PolicySnapshot>();
    snapshot->roles = std::move(roles.value());
    snapshot->policies = std::move(policies.value());
    snapshot->config = config.value();
    snapshot->generation = gen_after;
    snapshot->loaded_at = Clock::now();
    return SnapshotResult::ok(std::move(snapshot));
}

Result<Done> SnapshotLoader::refresh() {
    std::lock_guard lock(refresh_mutex_);

    auto result = load_once();
    int backoff_ms = config_.initial_backoff_ms;
    for (int attempt = 0; attempt < config_.max_retries && result.is_error(); ++attempt) {
        retries_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Snapshot load failed ({}: {}), retry {}/{} in {}ms",
                                     error_category_to_string(result.error_category()),
                                     result.error_message(), attempt + 1,
                                     config_.max_retries, backoff_ms));
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        result = load_once();
        backoff_ms = std::min(backoff_ms * 2, config_.max_backoff_ms);
    }

    if (result.is_error()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        last_refresh_ok_.store(false);
        utils::log::error(std::format("Snapshot refresh failed (keeping last snapshot): {}: {}",
                                      error_category_to_string(result.error_category()),
                                      result.error_message()));
        return Result<Done>::error(result.error_category(), result.error_message());
    }

    const auto& snapshot = result.value();
    utils::log::debug(std::format("Snapshot published: generation {}, {} policies, {} roles",
                                  snapshot->generation, snapshot->policies.size(),
                                  snapshot->roles.size()));
    snapshot_.store(snapshot, std::memory_order_release);
    last_refresh_ok_.store(true);
    refreshes_.fetch_add(1, std::memory_order_relaxed);
    return Result<Done>::ok({});
}

std::shared_ptr<const PolicySnapshot> SnapshotLoader::current(Clock::time_point now) const {
    auto snapshot = snapshot_.load(std::memory_order_acquire);
    if (!snapshot) return nullptr;
    if (last_refresh_ok_.load()) return snapshot;
    if (now - snapshot->loaded_at <= config_.max_staleness) return snapshot;
    return nullptr;
}

// ============================================================================
// Background refresh
// ============================================================================

void SnapshotLoader::start(TickCallback on_tick) {
    if (running_.load()) return;
    on_tick_ = std::move(on_tick);
    running_.store(true);
    refresh_thread_ = std::jthread([this](std::stop_token stop) {
        refresh_loop(std::move(stop));
    });
    utils::log::info(std::format("Snapshot refresher started: every {}s, max staleness {}s",
                                 config_.interval.count(), config_.max_staleness.count()));
}

void SnapshotLoader::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (refresh_thread_.joinable()) {
        refresh_thread_.request_stop();
        refresh_thread_.join();
    }
    utils::log::info("Snapshot refresher stopped");
}

void SnapshotLoader::refresh_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in 100ms increments for responsive shutdown
        for (int i = 0; i < config_.interval.count() * 10 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stop.stop_requested()) break;

        const auto result = refresh();
        if (result.is_error() && !current()) {
            utils::log::error("No usable policy snapshot: evaluations fail closed");
        }
        if (on_tick_) on_tick_();
    }
}

SnapshotLoader::Stats SnapshotLoader::get_stats() const {
    return {
        .refreshes = refreshes_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
        .retries = retries_.load(std::memory_order_relaxed),
    };
}

} // namespace rlsengine

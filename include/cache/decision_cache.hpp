#pragma once

#include "core/types.hpp"
#include "policy/filter_combiner.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rlsengine {

/**
 * @brief Decision Cache - memoizes Resolver + Compiler + Combiner output
 *
 * Keyed by table identity, sorted role set, generation and a digest of the
 * user's identity/attributes (dynamic conditions make filters per-user).
 * An entry is served only while its generation equals the current one and
 * `now - captured_at < ttl`. Stale entries are removed lazily on lookup and
 * in bulk by sweep(). Sharded LRU, one mutex per shard.
 */
class DecisionCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        size_t max_entries = 10000;
        size_t num_shards = 16;
    };

    explicit DecisionCache(const Config& config);

    /// "<generation>:<sha256>" over the table, the sorted role ids and the full identity
    [[nodiscard]] static std::string make_key(
        const TableIdentity& table,
        const UserSecurityContext& user,
        uint64_t generation);

    /// Fresh entry or nullopt. ttl <= 0 always misses.
    [[nodiscard]] std::optional<CombinedFilter> get(
        const std::string& key, uint64_t generation, std::chrono::seconds ttl,
        Clock::time_point now = Clock::now());

    void put(const std::string& key, uint64_t generation, CombinedFilter value,
             Clock::time_point now = Clock::now());

    /// Remove every entry that is past TTL or from an older generation
    size_t sweep(uint64_t generation, std::chrono::seconds ttl,
                 Clock::time_point now = Clock::now());

    void clear();

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t expirations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        CombinedFilter value;
        uint64_t generation = 0;
        Clock::time_point captured_at;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<CombinedFilter> get(const std::string& key, uint64_t generation,
                                          std::chrono::seconds ttl, Clock::time_point now);
        void put(const std::string& key, uint64_t generation, CombinedFilter value,
                 Clock::time_point now);
        size_t sweep(uint64_t generation, std::chrono::seconds ttl, Clock::time_point now);
        void clear();
        size_t size() const;

        std::atomic<uint64_t> evictions{0};
        std::atomic<uint64_t> expirations{0};

    private:
        static bool is_fresh(const CacheEntry& entry, uint64_t generation,
                             std::chrono::seconds ttl, Clock::time_point now) {
            return entry.generation == generation && now - entry.captured_at < ttl;
        }

        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;
    };

    size_t select_shard(const std::string& key) const;

    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace rlsengine

#include "cache/decision_cache.hpp"
#include "core/digest.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <string_view>
#include <vector>

namespace rlsengine {

// ============================================================================
// Key encoding
// ============================================================================
//
// Every string is length-prefixed and every value is type-tagged, so no two
// distinct requests share an encoding. Raw bytes go in unchanged; strings
// need not be valid UTF-8.

namespace {

void append_field(std::string& out, std::string_view field) {
    out += std::format("{}:", field.size());
    out += field;
}

void append_value(std::string& out, const AttributeValue& value) {
    switch (value.type()) {
        case AttributeValue::value_t::null:
            out += 'n';
            break;
        case AttributeValue::value_t::boolean:
            out += value.get<bool>() ? "t" : "f";
            break;
        case AttributeValue::value_t::number_integer:
        case AttributeValue::value_t::number_unsigned:
        case AttributeValue::value_t::number_float:
            out += 'd';
            append_field(out, value.dump());
            break;
        case AttributeValue::value_t::string:
            out += 's';
            append_field(out, value.get_ref<const std::string&>());
            break;
        case AttributeValue::value_t::array:
            out += std::format("a{}:", value.size());
            for (const auto& item : value) {
                append_value(out, item);
            }
            break;
        case AttributeValue::value_t::object:
            // Object keys iterate in sorted order
            out += std::format("o{}:", value.size());
            for (auto it = value.begin(); it != value.end(); ++it) {
                append_field(out, it.key());
                append_value(out, it.value());
            }
            break;
        case AttributeValue::value_t::binary:
        case AttributeValue::value_t::discarded:
            out += 'x';
            break;
    }
}

} // anonymous namespace

// ============================================================================
// DecisionCache
// ============================================================================

DecisionCache::DecisionCache(const Config& config) {
    const size_t num_shards = std::max(config.num_shards, size_t{1});
    const size_t per_shard = std::max(config.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

std::string DecisionCache::make_key(
    const TableIdentity& table,
    const UserSecurityContext& user,
    uint64_t generation) {

    std::string canonical;
    canonical.reserve(256);
    append_field(canonical, table.connection_id);
    append_field(canonical, table.schema);
    append_field(canonical, table.table);

    const auto roles = user.sorted_roles();
    canonical += std::format("R{}:", roles.size());
    for (const auto& role : roles) {
        append_field(canonical, role);
    }

    append_field(canonical, user.user_id);
    append_field(canonical, user.username);
    if (user.email) {
        append_field(canonical, *user.email);
    } else {
        canonical += '-';
    }

    std::vector<const AttributeMap::value_type*> attributes;
    attributes.reserve(user.attributes.size());
    for (const auto& entry : user.attributes) {
        attributes.push_back(&entry);
    }
    std::sort(attributes.begin(), attributes.end(),
              [](const auto* a, const auto* b) { return a->first < b->first; });
    canonical += std::format("A{}:", attributes.size());
    for (const auto* entry : attributes) {
        append_field(canonical, entry->first);
        append_value(canonical, entry->second);
    }

    return std::format("{}:{}", generation, utils::sha256_hex(canonical));
}

size_t DecisionCache::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

std::optional<CombinedFilter> DecisionCache::get(
    const std::string& key, uint64_t generation, std::chrono::seconds ttl,
    Clock::time_point now) {

    if (ttl.count() <= 0) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto& shard = *shards_[select_shard(key)];
    auto result = shard.get(key, generation, ttl, now);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void DecisionCache::put(const std::string& key, uint64_t generation, CombinedFilter value,
                        Clock::time_point now) {
    auto& shard = *shards_[select_shard(key)];
    shard.put(key, generation, std::move(value), now);
}

size_t DecisionCache::sweep(uint64_t generation, std::chrono::seconds ttl,
                            Clock::time_point now) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        removed += shard->sweep(generation, ttl, now);
    }
    return removed;
}

void DecisionCache::clear() {
    for (auto& shard : shards_) {
        shard->clear();
    }
}

DecisionCache::Stats DecisionCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
        expirations += shard->expirations.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .expirations = expirations,
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<CombinedFilter> DecisionCache::Shard::get(
    const std::string& key, uint64_t generation, std::chrono::seconds ttl,
    Clock::time_point now) {

    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    // Lazy removal: never serve past TTL or across a generation bump
    if (!is_fresh(*it->second, generation, ttl, now)) {
        lru_list_.erase(it->second);
        map_.erase(it);
        expirations.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->value;
}

void DecisionCache::Shard::put(
    const std::string& key, uint64_t generation, CombinedFilter value,
    Clock::time_point now) {

    std::lock_guard lock(mutex_);

    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->value = std::move(value);
        it->second->generation = generation;
        it->second->captured_at = now;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, std::move(value), generation, now});
    map_[key] = lru_list_.begin();
}

size_t DecisionCache::Shard::sweep(uint64_t generation, std::chrono::seconds ttl,
                                   Clock::time_point now) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = lru_list_.begin(); it != lru_list_.end(); ) {
        if (is_fresh(*it, generation, ttl, now)) {
            ++it;
            continue;
        }
        map_.erase(it->key);
        it = lru_list_.erase(it);
        ++removed;
    }
    expirations.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

void DecisionCache::Shard::clear() {
    std::lock_guard lock(mutex_);
    map_.clear();
    lru_list_.clear();
}

size_t DecisionCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace rlsengine

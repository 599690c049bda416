#pragma once

#include "policy/policy_types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace rlsengine {

// ============================================================================
// Engine configuration ([logging] [rls] [cache] [refresh] [audit] [store])
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct CacheConfig {
    size_t max_entries;
    size_t num_shards;
    std::chrono::seconds sweep_interval;

    CacheConfig()
        : max_entries(10000),
          num_shards(16),
          sweep_interval(60) {}
};

struct RefreshConfig {
    std::chrono::seconds interval{30};          // Periodic background refresh
    std::chrono::seconds max_staleness{300};    // Serve last good snapshot this long
    int max_retries = 3;
    int initial_backoff_ms = 100;
    int max_backoff_ms = 2000;
};

struct AuditConfig {
    bool enabled = true;                        // Access log file for logAccess / auditMode
    std::string output_file = "rls_access.jsonl";
    std::chrono::milliseconds batch_flush_interval{100};
    bool integrity_enabled = true;              // SHA-256 hash chain
    size_t queue_capacity = 16384;              // Records buffered ahead of the writer

    // File rotation
    size_t rotation_max_file_size_mb = 100;
    int rotation_max_files = 10;
    int rotation_interval_hours = 24;
    bool rotation_time_based = true;
    bool rotation_size_based = true;
};

struct StoreConfig {
    std::string seed_file;                      // TOML [[roles]] / [[policies]]
    bool watch_seed_file = false;
    std::chrono::seconds watch_interval{5};
};

struct EngineConfig {
    LoggingConfig logging;
    RlsConfiguration rls;
    CacheConfig cache;
    RefreshConfig refresh;
    AuditConfig audit;
    StoreConfig store;
};

} // namespace rlsengine

#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace rlsengine {

// ============================================================================
// Environment expansion
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables
 * @throws std::runtime_error on an unclosed "${"
 */
std::string expand_env_vars(const std::string& input) {
    if (!input.contains("${")) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (input.compare(i, 2, "${") != 0) {
            result += input[i++];
            continue;
        }
        const size_t close = input.find('}', i + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", i));
        }
        const std::string name = input.substr(i + 2, close - i - 2);
        if (const char* value = std::getenv(name.c_str())) result += value;
        i = close + 1;
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) expand_node(val);
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_node(elem);
    }
}

// ============================================================================
// Section extractors
// ============================================================================

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    if (!utils::log::parse_level(cfg.level)) {
        throw std::runtime_error(std::format("[logging] invalid level '{}'", cfg.level));
    }
    return cfg;
}

RlsConfiguration extract_rls(const toml::table& root) {
    RlsConfiguration cfg;
    const auto* rls = root["rls"].as_table();
    if (!rls) return cfg;
    const auto& r = *rls;

    cfg.enabled = r["enabled"].value_or(cfg.enabled);
    cfg.default_deny = r["default_deny"].value_or(cfg.default_deny);
    cfg.cache_ttl_seconds = r["cache_ttl_seconds"].value_or(cfg.cache_ttl_seconds);
    cfg.log_access = r["log_access"].value_or(cfg.log_access);
    cfg.audit_mode = r["audit_mode"].value_or(cfg.audit_mode);

    if (cfg.cache_ttl_seconds < 0) {
        throw std::runtime_error("[rls] cache_ttl_seconds must be >= 0");
    }
    return cfg;
}

CacheConfig extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.max_entries = static_cast<size_t>(c["max_entries"].value_or(10000));
    cfg.num_shards = static_cast<size_t>(c["num_shards"].value_or(16));
    cfg.sweep_interval = std::chrono::seconds(c["sweep_interval_seconds"].value_or(60));
    return cfg;
}

RefreshConfig extract_refresh(const toml::table& root) {
    RefreshConfig cfg;
    const auto* refresh = root["refresh"].as_table();
    if (!refresh) return cfg;
    const auto& r = *refresh;

    cfg.interval = std::chrono::seconds(r["interval_seconds"].value_or(30));
    cfg.max_staleness = std::chrono::seconds(r["max_staleness_seconds"].value_or(300));
    cfg.max_retries = r["max_retries"].value_or(3);
    cfg.initial_backoff_ms = r["initial_backoff_ms"].value_or(100);
    cfg.max_backoff_ms = r["max_backoff_ms"].value_or(2000);

    if (cfg.interval.count() <= 0) {
        throw std::runtime_error("[refresh] interval_seconds must be > 0");
    }
    if (cfg.max_retries < 0 || cfg.initial_backoff_ms < 0 || cfg.max_backoff_ms < cfg.initial_backoff_ms) {
        throw std::runtime_error("[refresh] invalid retry/backoff settings");
    }
    return cfg;
}

AuditConfig extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(true);
    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.batch_flush_interval = std::chrono::milliseconds(a["flush_interval_ms"].value_or(100));
    cfg.integrity_enabled = a["integrity_enabled"].value_or(true);
    const int64_t queue_capacity = a["queue_capacity"].value_or(int64_t{16384});
    if (queue_capacity <= 0) {
        throw std::runtime_error("[audit] queue_capacity must be positive");
    }
    cfg.queue_capacity = static_cast<size_t>(queue_capacity);

    if (const auto* r = a["rotation"].as_table()) {
        cfg.rotation_max_file_size_mb = static_cast<size_t>((*r)["max_file_size_mb"].value_or(100));
        cfg.rotation_max_files = (*r)["max_files"].value_or(10);
        cfg.rotation_interval_hours = (*r)["interval_hours"].value_or(24);
        cfg.rotation_time_based = (*r)["time_based"].value_or(true);
        cfg.rotation_size_based = (*r)["size_based"].value_or(true);
    }
    return cfg;
}

StoreConfig extract_store(const toml::table& root) {
    StoreConfig cfg;
    const auto* store = root["store"].as_table();
    if (!store) return cfg;
    const auto& s = *store;

    cfg.seed_file = s["seed_file"].value_or(""s);
    cfg.watch_seed_file = s["watch"].value_or(false);
    cfg.watch_interval = std::chrono::seconds(s["watch_interval_seconds"].value_or(5));
    return cfg;
}

EngineConfig extract_all(const toml::table& root) {
    EngineConfig cfg;
    cfg.logging = extract_logging(root);
    cfg.rls = extract_rls(root);
    cfg.cache = extract_cache(root);
    cfg.refresh = extract_refresh(root);
    cfg.audit = extract_audit(root);
    cfg.store = extract_store(root);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto root = toml::parse_file(config_path);
        expand_table(root);
        auto cfg = extract_all(root);

        namespace fs = std::filesystem;
        if (!cfg.store.seed_file.empty() && fs::path(cfg.store.seed_file).is_relative()) {
            cfg.store.seed_file =
                (fs::path(config_path).parent_path() / cfg.store.seed_file).string();
        }
        return LoadResult::ok(std::move(cfg));

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {}: {}", config_path, e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Config error in {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        expand_table(root);
        return LoadResult::ok(extract_all(root));

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Config error: {}", e.what()));
    }
}

} // namespace rlsengine

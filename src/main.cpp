#include "audit/access_log_emitter.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "core/utils.hpp"
#include "engine/rls_engine.hpp"
#include "policy/policy_codec.hpp"
#include "policy/policy_loader.hpp"
#include "policy/policy_tester.hpp"
#include "store/memory_policy_store.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace rlsengine;

// Global handles for signal handling
static std::shared_ptr<RlsEngine> g_engine;
static std::shared_ptr<ConfigWatcher> g_config_watcher;
static std::shared_ptr<AccessLogEmitter> g_access_log;

namespace {

struct CliOptions {
    std::string config_file = "config/rls.toml";
    std::optional<std::string> requests_file;
    std::optional<std::string> simulate_file;
};

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [--config <file.toml>] [--requests <file.jsonl>] [--simulate <proposed.toml>]\n"
        "\n"
        "Reads one evaluation request per line (JSON: connectionId, schemaName,\n"
        "tableName, userContext) and writes one FilterDecision per line.\n"
        "With --simulate, compares the proposed policy seed against the\n"
        "configured one over the same requests and prints a summary.\n",
        argv0);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            opts.config_file = argv[++i];
        } else if (arg == "--requests" && has_value) {
            opts.requests_file = argv[++i];
        } else if (arg == "--simulate" && has_value) {
            opts.simulate_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (i == 1 && !arg.starts_with("-")) {
            // Bare first argument is the config path
            opts.config_file = arg;
        } else {
            std::cerr << std::format("Unknown argument: {}\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

void shutdown_services() {
    if (g_config_watcher) {
        g_config_watcher->stop();
    }
    if (g_engine) {
        g_engine->stop();
    }
    if (g_access_log) {
        g_access_log->shutdown();
    }
}

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    shutdown_services();
    std::exit(0);
}

/// Parse every non-empty line; malformed lines are reported and skipped
std::vector<EvaluationRequest> read_requests(std::istream& in) {
    std::vector<EvaluationRequest> requests;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (utils::trim(line).empty()) continue;
        try {
            requests.push_back(parse_json(line).get<EvaluationRequest>());
        } catch (const PolicyCodecError& e) {
            utils::log::warn(std::format("Request line {}: {}", line_no, e.what()));
        }
    }
    return requests;
}

int run_simulation(const std::shared_ptr<MemoryPolicyStore>& store,
                   const std::string& proposed_file,
                   const std::vector<EvaluationRequest>& requests) {
    auto proposed = PolicyLoader::load_from_file(proposed_file);
    if (!proposed.success) {
        utils::log::error(std::format("Failed to load proposed policies: {}",
                                      proposed.error_message));
        return 1;
    }

    auto baseline = store->list_policies();
    auto config = store->get_config();
    if (baseline.is_error() || config.is_error()) {
        utils::log::error("Failed to read current policies from the store");
        return 1;
    }

    const auto result = PolicyTester::simulate(
        baseline.value(), proposed.seed.policies, config.value(), requests);

    nlohmann::json summary = {
        {"totalRequests", result.total_requests},
        {"changed", result.changed},
        {"newlyDenied", result.newly_denied},
        {"newlyAllowed", result.newly_allowed},
        {"unchanged", result.unchanged},
        {"durationUs", result.duration.count()},
        {"diffs", nlohmann::json::array()},
    };
    for (const auto& diff : result.diffs) {
        summary["diffs"].push_back({
            {"requestIndex", diff.request_index},
            {"userId", diff.user_id},
            {"table", diff.table.full_name()},
            {"baseline", diff.baseline},
            {"proposed", diff.proposed},
        });
    }
    std::cout << dump_json(summary, 2) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        utils::log::info("RLS Policy Engine starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // [1/5] Configuration
        utils::log::info(std::format("[1/5] Loading configuration from {}", opts->config_file));
        auto config_result = ConfigLoader::load_from_file(opts->config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // [2/5] Policy store
        utils::log::info("[2/5] Initializing policy store");
        auto store = std::make_shared<MemoryPolicyStore>(cfg.rls);
        if (!cfg.store.seed_file.empty()) {
            auto seed = PolicyLoader::load_from_file(cfg.store.seed_file);
            if (!seed.success) {
                utils::log::error(std::format("Failed to load policy seed: {}", seed.error_message));
                return 1;
            }
            auto replaced = store->replace_all(std::move(seed.seed.roles),
                                               std::move(seed.seed.policies));
            if (replaced.is_error()) {
                utils::log::error(std::format("Invalid policy seed {}: {}",
                                              cfg.store.seed_file, replaced.error_message()));
                return 1;
            }
        } else {
            utils::log::warn("No [store] seed_file configured, starting with no policies");
        }

        // [3/5] Access log
        utils::log::info("[3/5] Initializing access log");
        if (cfg.audit.enabled) {
            try {
                g_access_log = std::make_shared<AccessLogEmitter>(cfg.audit);
            } catch (const std::runtime_error& e) {
                utils::log::error(std::format("Access log unavailable: {}", e.what()));
                return 1;
            }
        }

        // [4/5] Engine
        utils::log::info("[4/5] Initializing RLS engine");
        g_engine = std::make_shared<RlsEngine>(store, cfg.cache, cfg.refresh, g_access_log);
        auto init = g_engine->initialize();
        if (init.is_error()) {
            // Evaluations fail closed until a snapshot loads
            utils::log::error(std::format("Initial snapshot load failed: {}", init.error_message()));
        }
        g_engine->start();

        if (cfg.store.watch_seed_file && !cfg.store.seed_file.empty()) {
            g_config_watcher = std::make_shared<ConfigWatcher>(
                cfg.store.seed_file, cfg.store.watch_interval);
            g_config_watcher->set_callback([store](PolicySeed seed) {
                auto replaced = store->replace_all(std::move(seed.roles), std::move(seed.policies));
                if (replaced.is_error()) {
                    utils::log::error(std::format("Seed reload rejected: {}",
                                                  replaced.error_message()));
                }
            });
            g_config_watcher->start();
        }

        // [5/5] Requests
        utils::log::info("[5/5] Reading evaluation requests");
        std::ifstream requests_stream;
        if (opts->requests_file) {
            requests_stream.open(*opts->requests_file);
            if (!requests_stream.is_open()) {
                utils::log::error(std::format("Cannot open requests file: {}", *opts->requests_file));
                shutdown_services();
                return 1;
            }
        }
        std::istream& in = opts->requests_file ? static_cast<std::istream&>(requests_stream)
                                               : std::cin;

        int exit_code = 0;
        if (opts->simulate_file) {
            exit_code = run_simulation(store, *opts->simulate_file, read_requests(in));
        } else {
            std::string line;
            size_t line_no = 0;
            while (std::getline(in, line)) {
                ++line_no;
                if (utils::trim(line).empty()) continue;
                try {
                    const auto request = parse_json(line).get<EvaluationRequest>();
                    const auto decision = g_engine->evaluate(request.table, request.user);
                    std::cout << dump_json(nlohmann::json(decision)) << '\n';
                } catch (const PolicyCodecError& e) {
                    utils::log::warn(std::format("Request line {}: {}", line_no, e.what()));
                    std::cout << dump_json(nlohmann::json{{"error", e.what()}}) << '\n';
                }
                std::cout.flush();
            }
        }

        const auto stats = g_engine->cache_stats();
        utils::log::info(std::format("Decision cache: {} hits, {} misses, {} entries",
                                     stats.hits, stats.misses, stats.current_entries));
        const auto loader = g_engine->loader_stats();
        utils::log::info(std::format("Snapshot loader: {} refreshes, {} failures, {} retries",
                                     loader.refreshes, loader.failures, loader.retries));

        shutdown_services();
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        shutdown_services();
        return 1;
    }
}

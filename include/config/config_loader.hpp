#pragma once

#include "config/config_types.hpp"

#include <string>

namespace rlsengine {

/**
 * @brief Engine configuration loader (TOML via toml++)
 *
 * ${VAR} in any string value is replaced by the environment variable
 * (empty when unset). A relative [store] seed_file is resolved against the
 * directory of the config file.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace rlsengine

#pragma once

#include "config/config_types.hpp"
#include "config/env_lookup.hpp"

#include <string>
#include <vector>

namespace bwproxy {

// ============================================================================
// ConfigLoader - Optional TOML file + environment overrides
// ============================================================================

/**
 * @brief Builds the SidecarConfig
 *
 * Sources, lowest precedence first: built-in defaults, an optional TOML file
 * (strings support ${VAR} expansion), then the BW_* environment variables.
 * Secrets are never read here; the AuthSequencer takes them straight from
 * the environment.
 *
 * Malformed ports and counts are errors. Malformed durations are warnings and
 * keep the default.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SidecarConfig config;
        std::vector<std::string> warnings;

        static LoadResult ok(SidecarConfig cfg, std::vector<std::string> warnings) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            result.warnings = std::move(warnings);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Defaults + environment only
     */
    [[nodiscard]] static LoadResult load_from_env(const EnvLookup& env);

    /**
     * @brief Load TOML file, then apply environment overrides
     * @param config_path Path to bw-proxy.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path, const EnvLookup& env);

    /**
     * @brief Load TOML content, then apply environment overrides
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content, const EnvLookup& env);

    [[nodiscard]] static std::vector<std::string> validate_config(const SidecarConfig& config);
};

} // namespace bwproxy

#pragma once

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bwproxy {

/**
 * @brief Read access to environment variables. An empty value counts as unset.
 */
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

[[nodiscard]] inline EnvLookup process_env() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (!value || !*value) return std::nullopt;
        return std::string(value);
    };
}

/// Fixed lookup table, used by tests and dry runs.
[[nodiscard]] inline EnvLookup static_env(std::unordered_map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        const auto it = vars.find(std::string(name));
        if (it == vars.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };
}

namespace env {
inline constexpr std::string_view kHost = "BW_HOST";
inline constexpr std::string_view kClientId = "BW_CLIENTID";
inline constexpr std::string_view kClientSecret = "BW_CLIENTSECRET";
inline constexpr std::string_view kPassword = "BW_PASSWORD";
inline constexpr std::string_view kSession = "BW_SESSION";
inline constexpr std::string_view kServePort = "BW_SERVE_PORT";
inline constexpr std::string_view kProxyPort = "BW_PROXY_PORT";
inline constexpr std::string_view kProxyHost = "BW_PROXY_HOST";
inline constexpr std::string_view kDisableSync = "BW_DISABLE_SYNC";
inline constexpr std::string_view kSyncInterval = "BW_SYNC_INTERVAL";
inline constexpr std::string_view kWaitRetries = "BW_SERVE_WAIT_RETRIES";
inline constexpr std::string_view kWaitInterval = "BW_SERVE_WAIT_INTERVAL";
inline constexpr std::string_view kConfigFile = "BW_PROXY_CONFIG";
} // namespace env

} // namespace bwproxy

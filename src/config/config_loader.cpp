#include "config/config_loader.hpp"
#include "core/duration.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>

using namespace std::string_literals;

namespace bwproxy {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input, const EnvLookup& env) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const auto value = env(var_name)) result += *value;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl, const EnvLookup& env) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get(), env);
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table(), env);
        }
    }
}

toml::table parse_toml_string(const std::string& content, const EnvLookup& env) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result, env);
    return result;
}

toml::table parse_toml_file(const std::string& file_path, const EnvLookup& env) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result, env);
    return result;
}

// ---- Value helpers ---------------------------------------------------------

struct Diagnostics {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

std::optional<std::chrono::milliseconds> parse_positive_duration(std::string_view raw) {
    const auto parsed = duration::parse(raw);
    if (!parsed || parsed->count() <= 0) return std::nullopt;
    return std::chrono::ceil<std::chrono::milliseconds>(*parsed);
}

void apply_duration(std::chrono::milliseconds& field, std::string_view raw,
                    std::string_view source, Diagnostics& diag) {
    if (const auto value = parse_positive_duration(raw)) {
        field = *value;
        return;
    }
    diag.warnings.push_back(std::format(
        "Invalid format for {} '{}', using default of {}",
        source, raw, duration::format(field)));
}

void apply_port(int& field, std::string_view raw, std::string_view source, Diagnostics& diag) {
    const auto port = utils::try_parse_int<int>(utils::trim(raw));
    if (!port || !utils::is_valid_port(*port)) {
        diag.errors.push_back(std::format("{} must be a port number 1-65535, got '{}'", source, raw));
        return;
    }
    field = *port;
}

template<typename Node>
void extract_port(int& field, const Node& node, std::string_view source, Diagnostics& diag) {
    if (!node) return;
    if (const auto v = node.template value<int64_t>(); v && node.is_integer()) {
        if (!utils::is_valid_port(*v)) {
            diag.errors.push_back(std::format("{} must be 1-65535, got {}", source, *v));
            return;
        }
        field = static_cast<int>(*v);
    } else {
        diag.errors.push_back(std::format("{} must be an integer", source));
    }
}

template<typename Node>
void extract_duration(std::chrono::milliseconds& field, const Node& node,
                      std::string_view source, Diagnostics& diag) {
    if (!node) return;
    if (const auto* s = node.as_string()) {
        apply_duration(field, s->get(), source, diag);
    } else {
        diag.warnings.push_back(std::format(
            "{} must be a duration string, using default of {}", source, duration::format(field)));
    }
}

// ---- Section extractors ----------------------------------------------------

void extract_vault(const toml::table& root, SidecarConfig& config) {
    const auto* vault = root["vault"].as_table();
    if (!vault) return;
    const auto& v = *vault;

    config.vault.cli = v["cli"].value_or(config.vault.cli);
    config.vault.server_host = v["server"].value_or(""s);
}

void extract_serve(const toml::table& root, SidecarConfig& config, Diagnostics& diag) {
    const auto* serve = root["serve"].as_table();
    if (!serve) return;
    const auto& s = *serve;

    config.serve.hostname = s["hostname"].value_or(config.serve.hostname);
    extract_port(config.serve.port, s["port"], "serve.port", diag);
}

void extract_readiness(const toml::table& root, SidecarConfig& config, Diagnostics& diag) {
    const auto* readiness = root["readiness"].as_table();
    if (!readiness) return;
    const auto& r = *readiness;

    if (const auto retries = r["retries"].value<int64_t>()) {
        if (*retries < 1) {
            diag.errors.push_back(std::format("readiness.retries must be >= 1, got {}", *retries));
        } else {
            config.readiness.policy.max_attempts = static_cast<int>(*retries);
        }
    }
    extract_duration(config.readiness.policy.interval, r["interval"], "readiness.interval", diag);
    extract_duration(config.readiness.request_timeout, r["timeout"], "readiness.timeout", diag);
}

void extract_proxy(const toml::table& root, SidecarConfig& config, Diagnostics& diag) {
    const auto* proxy = root["proxy"].as_table();
    if (!proxy) return;
    const auto& p = *proxy;

    config.proxy.listen_host = p["listen"].value_or(config.proxy.listen_host);
    config.proxy.public_host = p["host"].value_or(config.proxy.public_host);
    extract_port(config.proxy.port, p["port"], "proxy.port", diag);
    if (const auto threads = p["threads"].value<int64_t>()) {
        if (*threads < 1) {
            diag.errors.push_back(std::format("proxy.threads must be >= 1, got {}", *threads));
        } else {
            config.proxy.thread_pool_size = static_cast<size_t>(*threads);
        }
    }
    extract_duration(config.proxy.upstream_read_timeout, p["upstream_timeout"], "proxy.upstream_timeout", diag);
}

void extract_sync(const toml::table& root, SidecarConfig& config) {
    const auto* sync = root["sync"].as_table();
    if (!sync) return;
    const auto& s = *sync;

    config.sync.enabled = s["enabled"].value_or(config.sync.enabled);
    config.sync.interval = s["interval"].value_or(config.sync.interval);
}

// ---- Environment overrides -------------------------------------------------

void apply_env_overrides(const EnvLookup& lookup, SidecarConfig& config, Diagnostics& diag) {
    if (auto host = lookup(env::kHost)) {
        config.vault.server_host = std::move(*host);
    }
    if (const auto port = lookup(env::kServePort)) {
        apply_port(config.serve.port, *port, env::kServePort, diag);
    }
    if (const auto port = lookup(env::kProxyPort)) {
        apply_port(config.proxy.port, *port, env::kProxyPort, diag);
    }
    if (auto host = lookup(env::kProxyHost)) {
        config.proxy.public_host = std::move(*host);
    }
    if (const auto disabled = lookup(env::kDisableSync)) {
        config.sync.enabled = *disabled != "true";   // exact match only
    }
    if (auto interval = lookup(env::kSyncInterval)) {
        config.sync.interval = std::move(*interval);
    }
    if (const auto retries = lookup(env::kWaitRetries)) {
        const auto parsed = utils::try_parse_int<int>(utils::trim(*retries));
        if (parsed && *parsed >= 1) {
            config.readiness.policy.max_attempts = *parsed;
        } else {
            diag.warnings.push_back(std::format(
                "Invalid value for {} '{}', using {} attempts",
                env::kWaitRetries, *retries, config.readiness.policy.max_attempts));
        }
    }
    if (const auto interval = lookup(env::kWaitInterval)) {
        apply_duration(config.readiness.policy.interval, *interval, env::kWaitInterval, diag);
    }
}

/**
 * @brief Propagate the ports/hosts that several components share.
 *
 * The poller and the reverse proxy both target bw serve; the periodic sync
 * targets the sidecar's own listener.
 */
void link_sections(SidecarConfig& config) {
    config.readiness.port = config.serve.port;
    config.proxy.backend_port = config.serve.port;
    config.sync.target_host = config.proxy.public_host;
    config.sync.target_port = config.proxy.port;
}

ConfigLoader::LoadResult finalize(SidecarConfig config, Diagnostics diag) {
    link_sections(config);

    for (auto& err : ConfigLoader::validate_config(config)) {
        diag.errors.push_back(std::move(err));
    }
    if (!diag.errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : diag.errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config), std::move(diag.warnings));
}

ConfigLoader::LoadResult load_table(const toml::table& tbl, const EnvLookup& env) {
    SidecarConfig config;
    Diagnostics diag;
    extract_vault(tbl, config);
    extract_serve(tbl, config, diag);
    extract_readiness(tbl, config, diag);
    extract_proxy(tbl, config, diag);
    extract_sync(tbl, config);
    apply_env_overrides(env, config, diag);
    return finalize(std::move(config), std::move(diag));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_env(const EnvLookup& env) {
    SidecarConfig config;
    Diagnostics diag;
    apply_env_overrides(env, config, diag);
    return finalize(std::move(config), std::move(diag));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path, const EnvLookup& env) {
    try {
        const auto tbl = parse_toml_file(config_path, env);
        return load_table(tbl, env);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content, const EnvLookup& env) {
    try {
        const auto tbl = parse_toml_string(toml_content, env);
        return load_table(tbl, env);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SidecarConfig& config) {
    std::vector<std::string> errors;

    if (config.vault.cli.empty()) {
        errors.emplace_back("vault.cli must not be empty");
    }
    if (config.serve.port == config.proxy.port) {
        errors.push_back(std::format(
            "proxy port and serve port must differ, both are {}", config.proxy.port));
    }
    if (config.proxy.public_host.empty()) {
        errors.emplace_back("proxy host must not be empty");
    }
    if (config.readiness.policy.max_attempts < 1) {
        errors.push_back(std::format("readiness retries must be >= 1, got {}",
            config.readiness.policy.max_attempts));
    }

    return errors;
}

} // namespace bwproxy

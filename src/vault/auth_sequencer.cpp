#include "vault/auth_sequencer.hpp"
#include "core/utils.hpp"

#include <format>
#include <vector>

namespace bwproxy {

AuthSequencer::AuthSequencer(VaultConfig config, CommandExecutor executor, EnvLookup env)
    : config_(std::move(config)),
      cli_(config_.cli),
      executor_(std::move(executor)),
      env_(std::move(env)) {}

Result<std::string> AuthSequencer::run_step(std::string_view step, CommandSpec spec) const {
    const auto result = executor_(spec);
    if (!result.ok()) {
        return Result<std::string>::error(ErrorCategory::COMMAND_ERROR,
            std::format("{} failed: {} - {}", step, utils::trim(result.output), result.describe()));
    }
    return Result<std::string>::ok(result.output);
}

Result<std::string> AuthSequencer::login_and_get_session() const {
    utils::log::info("Executing Bitwarden login...");

    const auto client_id = env_(env::kClientId);
    const auto client_secret = env_(env::kClientSecret);
    const auto password = env_(env::kPassword);

    if (!client_id || !client_secret || !password) {
        std::vector<std::string_view> missing;
        if (!client_id) missing.push_back(env::kClientId);
        if (!client_secret) missing.push_back(env::kClientSecret);
        if (!password) missing.push_back(env::kPassword);

        std::string names;
        for (const auto name : missing) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        return Result<std::string>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("missing required environment variables: {}", names));
    }

    if (!config_.server_host.empty()) {
        utils::log::info(std::format("Configuring bw-cli to use the supplied host {}", config_.server_host));
        CommandSpec spec;
        spec.argv = cli_.config_server(config_.server_host);
        if (auto step = run_step("bw config server", std::move(spec)); step.is_error()) {
            return step;
        }
    }

    CommandSpec login;
    login.argv = cli_.login_apikey();
    login.env = {
        {std::string(env::kClientId), *client_id},
        {std::string(env::kClientSecret), *client_secret},
    };
    if (auto step = run_step("bw login", std::move(login)); step.is_error()) {
        return step;
    }
    utils::log::info("Logged in successfully");

    utils::log::info("Unlocking vault...");
    CommandSpec unlock;
    unlock.argv = cli_.unlock_raw(env::kPassword);
    unlock.env = {{std::string(env::kPassword), *password}};
    auto step = run_step("bw unlock", std::move(unlock));
    if (step.is_error()) {
        return step;
    }

    std::string session = utils::trim(step.value());
    if (session.empty()) {
        return Result<std::string>::error(ErrorCategory::COMMAND_ERROR,
            "bw unlock returned an empty session key");
    }
    return Result<std::string>::ok(std::move(session));
}

} // namespace bwproxy

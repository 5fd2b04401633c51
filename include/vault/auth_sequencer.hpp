#pragma once

#include "config/config_types.hpp"
#include "config/env_lookup.hpp"
#include "core/error.hpp"
#include "process/command_runner.hpp"
#include "vault/bw_cli.hpp"

#include <string>

namespace bwproxy {

/**
 * @brief Runs config server -> login -> unlock and returns the session key
 *
 * Requires BW_CLIENTID, BW_CLIENTSECRET and BW_PASSWORD in the environment.
 * The values are forwarded to the child that needs them as explicit
 * environment overrides. No retries: the first failure is returned.
 */
class AuthSequencer {
public:
    AuthSequencer(VaultConfig config, CommandExecutor executor, EnvLookup env = process_env());

    /**
     * @return trimmed session key, CONFIGURATION_ERROR for missing secrets,
     *         COMMAND_ERROR for any failed CLI step
     */
    [[nodiscard]] Result<std::string> login_and_get_session() const;

private:
    [[nodiscard]] Result<std::string> run_step(std::string_view step, CommandSpec spec) const;

    const VaultConfig config_;
    const BwCli cli_;
    CommandExecutor executor_;
    EnvLookup env_;
};

} // namespace bwproxy

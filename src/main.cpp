#include "config/config_loader.hpp"
#include "config/env_lookup.hpp"
#include "core/utils.hpp"
#include "process/command_runner.hpp"
#include "server/proxy_server.hpp"
#include "sync/periodic_sync.hpp"
#include "sync/sync_service.hpp"
#include "vault/auth_sequencer.hpp"
#include "vault/backing_service.hpp"
#include "vault/readiness_poller.hpp"

#include <cstdlib>
#include <exception>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace bwproxy;

// Startup failures are unrecoverable. Threads (bw serve, the listener) may
// already be running, so skip destructors and leave immediately.
[[noreturn]] static void die(const std::string& message) {
    utils::log::fatal(message);
    std::_Exit(EXIT_FAILURE);
}

static std::optional<std::string> config_path(int argc, char* argv[], const EnvLookup& env) {
    if (argc > 1) return std::string(argv[1]);
    return env(env::kConfigFile);
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Bitwarden serve proxy starting...");
        const auto env = process_env();

        // Configuration
        const auto path = config_path(argc, argv, env);
        if (path) {
            utils::log::info(std::format("[1/5] Loading configuration from {}", *path));
        } else {
            utils::log::info("[1/5] Loading configuration from environment");
        }
        auto loaded = path ? ConfigLoader::load_from_file(*path, env)
                           : ConfigLoader::load_from_env(env);
        if (!loaded.success) {
            die(loaded.error_message);
        }
        for (const auto& warning : loaded.warnings) {
            utils::log::warn(warning);
        }
        const SidecarConfig config = std::move(loaded.config);
        const CommandExecutor executor = system_executor();

        // Login, unlock, session key
        utils::log::info("[2/5] Authenticating with the Bitwarden CLI");
        const AuthSequencer auth(config.vault, executor, env);
        const auto session = auth.login_and_get_session();
        if (session.is_error()) {
            die(std::format("Bitwarden login failed: {}", session.failure().describe()));
        }

        // bw serve in the background; its exit is fatal
        utils::log::info("[3/5] Launching bw serve");
        BackingServiceLauncher launcher(config.vault, config.serve, executor,
            [](const CommandResult& result) {
                die(std::format("'bw serve' process failed: {}", result.describe()));
            });
        launcher.start(session.value());

        // Nothing is routed until the vault reports unlocked
        ReadinessPoller poller(config.readiness);
        if (const auto ready = poller.wait_for_ready(); ready.is_error()) {
            die(std::format("Bitwarden serve API failed to initialize: {}", ready.failure().describe()));
        }
        utils::log::info("Bitwarden serve API is ready and unlocked. Authentication successful.");

        // Proxy server
        utils::log::info("[4/5] Starting proxy server");
        auto sync_service = std::make_shared<SyncService>(
            BwCli(config.vault.cli), executor, session.value());
        ProxyServer server(config.proxy, sync_service);
        server.bind();
        std::thread server_thread([&server] {
            try {
                server.listen();
            } catch (const std::exception& e) {
                die(std::format("Proxy server failed: {}", e.what()));
            }
            die("Proxy server stopped unexpectedly");
        });

        // Periodic sync
        utils::log::info("[5/5] Configuring periodic sync");
        PeriodicSyncScheduler periodic_sync(config.sync);
        if (config.sync.enabled) {
            periodic_sync.start();
        } else {
            utils::log::info("Automatic sync is disabled.");
        }

        // Serve forever; every exit path above terminates the process.
        server_thread.join();
    } catch (const std::exception& e) {
        die(std::format("Unexpected error during startup: {}", e.what()));
    }
    return EXIT_SUCCESS;
}

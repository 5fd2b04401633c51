#pragma once

#include "config/config_types.hpp"
#include "process/command_runner.hpp"
#include "vault/bw_cli.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace bwproxy {

/**
 * @brief Runs `bw serve` for the lifetime of the sidecar
 *
 * The process is started on its own thread with the parent's stdout/stderr.
 * There is no restart policy: whenever the process ends, for any reason,
 * the exit handler is invoked with its result. main() installs a handler
 * that terminates the sidecar.
 */
class BackingServiceLauncher {
public:
    using ExitHandler = std::function<void(const CommandResult&)>;

    BackingServiceLauncher(VaultConfig vault, ServeConfig serve,
                           CommandExecutor executor, ExitHandler on_exit);

    /// Joins the serve thread; only returns once bw serve has exited.
    ~BackingServiceLauncher();

    BackingServiceLauncher(const BackingServiceLauncher&) = delete;
    BackingServiceLauncher& operator=(const BackingServiceLauncher&) = delete;

    /**
     * @brief Spawn bw serve with the session key (argument and BW_SESSION)
     * @throws std::logic_error if already started
     */
    void start(const std::string& session);

    [[nodiscard]] bool running() const { return running_.load(std::memory_order_acquire); }

    /// Command line as it will be executed (session included).
    [[nodiscard]] CommandSpec build_spec(const std::string& session) const;

private:
    void run(CommandSpec spec);

    const ServeConfig serve_;
    const BwCli cli_;
    CommandExecutor executor_;
    ExitHandler on_exit_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::thread serve_thread_;
};

} // namespace bwproxy

#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace bwproxy {

/**
 * @brief How a child process' stdout/stderr are wired
 */
enum class OutputMode {
    CAPTURE,   // stdout + stderr merged into CommandResult::output
    INHERIT    // child writes straight to the sidecar's own streams
};

/**
 * @brief One external command invocation
 */
struct CommandSpec {
    std::vector<std::string> argv;                              // argv[0] resolved via PATH
    std::vector<std::pair<std::string, std::string>> env;       // overrides on top of inherited environ
    OutputMode output = OutputMode::CAPTURE;
    bool die_with_parent = false;                               // SIGTERM the child if the sidecar dies (Linux)
};

struct CommandResult {
    bool spawned = false;       // false when pipe/fork failed; output holds the reason
    int exit_code = -1;         // 128 + signal number when killed by a signal
    int term_signal = 0;
    std::string output;

    [[nodiscard]] bool ok() const { return spawned && exit_code == 0; }

    /// "exit status 1", "signal 9", or the spawn failure reason
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Capability to run an external command and wait for it to finish
 *
 * Components receive this at construction time; tests substitute a recording
 * fake instead of spawning real processes.
 */
using CommandExecutor = std::function<CommandResult(const CommandSpec&)>;

/// Fork/exec the command and block until it exits.
[[nodiscard]] CommandResult run_command(const CommandSpec& spec);

/// Executor backed by run_command().
[[nodiscard]] CommandExecutor system_executor();

/// Command line for logs. Values following --session are redacted.
[[nodiscard]] std::string format_command(const std::vector<std::string>& argv);

} // namespace bwproxy

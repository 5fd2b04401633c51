#pragma once

#include "process/command_runner.hpp"
#include "vault/bw_cli.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace bwproxy {

/**
 * @brief Result of one `bw sync` run
 */
struct SyncOutcome {
    bool success = false;
    int exit_code = -1;
    std::string output;     // combined stdout + stderr
};

/**
 * @brief Runs `bw sync` on behalf of the /sync endpoint
 *
 * Runs are serialized: overlapping callers (manual trigger racing the
 * periodic scheduler, or two manual triggers) queue on a mutex and each
 * performs its own run with its own outcome.
 */
class SyncService {
public:
    SyncService(BwCli cli, CommandExecutor executor, std::string session);

    [[nodiscard]] SyncOutcome run();

    struct Stats {
        uint64_t runs = 0;
        uint64_t failures = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    const BwCli cli_;
    CommandExecutor executor_;
    const std::string session_;

    std::mutex run_mutex_;
    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace bwproxy

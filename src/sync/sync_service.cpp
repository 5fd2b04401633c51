#include "sync/sync_service.hpp"
#include "config/env_lookup.hpp"
#include "core/utils.hpp"

#include <format>

namespace bwproxy {

SyncService::SyncService(BwCli cli, CommandExecutor executor, std::string session)
    : cli_(std::move(cli)),
      executor_(std::move(executor)),
      session_(std::move(session)) {}

SyncOutcome SyncService::run() {
    CommandSpec spec;
    spec.argv = cli_.sync();
    spec.env = {{std::string(env::kSession), session_}};

    std::lock_guard lock(run_mutex_);
    utils::log::info("Executing 'bw sync'...");
    const auto result = executor_(spec);
    runs_.fetch_add(1, std::memory_order_relaxed);

    SyncOutcome outcome;
    outcome.success = result.ok();
    outcome.exit_code = result.exit_code;
    outcome.output = result.output;

    if (outcome.success) {
        utils::log::info("Sync successful.");
    } else {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Sync failed ({}): {}",
            result.describe(), utils::trim(result.output)));
    }
    return outcome;
}

SyncService::Stats SyncService::get_stats() const {
    Stats s;
    s.runs = runs_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace bwproxy

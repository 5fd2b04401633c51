#pragma once

#include "config/config_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace bwproxy {

/**
 * @brief Background loop that POSTs to the sidecar's own /sync endpoint
 *
 * Sync always goes through the HTTP endpoint, so periodic and manual syncs
 * share one code path. Failures (non-200 or network errors) are logged and
 * the loop continues; nothing here terminates the process.
 */
class PeriodicSyncScheduler {
public:
    static constexpr std::chrono::milliseconds kDefaultInterval{std::chrono::minutes(2)};
    // One year; anything longer would overflow the wait deadline.
    static constexpr std::chrono::milliseconds kMaxInterval{std::chrono::hours(24 * 365)};

    explicit PeriodicSyncScheduler(SyncConfig config);
    ~PeriodicSyncScheduler();

    PeriodicSyncScheduler(const PeriodicSyncScheduler&) = delete;
    PeriodicSyncScheduler& operator=(const PeriodicSyncScheduler&) = delete;

    /// No-op when disabled or already running.
    void start();
    void stop();

    /// Fire one sync request now. Returns true on HTTP 200.
    bool trigger_once();

    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }
    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

    /**
     * @brief Parse a duration string, falling back to 2 minutes (with a warning)
     *        when it is malformed or not positive
     */
    [[nodiscard]] static std::chrono::milliseconds resolve_interval(std::string_view raw);

    struct Stats {
        uint64_t ticks = 0;
        uint64_t failures = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void sync_loop();

    const SyncConfig config_;
    const std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread sync_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace bwproxy

#include "sync/periodic_sync.hpp"
#include "core/duration.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace bwproxy {

PeriodicSyncScheduler::PeriodicSyncScheduler(SyncConfig config)
    : config_(std::move(config)),
      interval_(resolve_interval(config_.interval)) {}

PeriodicSyncScheduler::~PeriodicSyncScheduler() {
    stop();
}

std::chrono::milliseconds PeriodicSyncScheduler::resolve_interval(std::string_view raw) {
    const auto parsed = duration::parse(raw);
    if (!parsed || parsed->count() <= 0) {
        utils::log::warn(std::format(
            "Invalid format for BW_SYNC_INTERVAL '{}', using default of {}",
            raw, duration::format(kDefaultInterval)));
        return kDefaultInterval;
    }
    if (*parsed > kMaxInterval) {
        utils::log::warn(std::format(
            "BW_SYNC_INTERVAL '{}' exceeds the maximum of {}, using default of {}",
            raw, duration::format(kMaxInterval), duration::format(kDefaultInterval)));
        return kDefaultInterval;
    }
    return std::chrono::ceil<std::chrono::milliseconds>(*parsed);
}

void PeriodicSyncScheduler::start() {
    if (!config_.enabled) return;

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    utils::log::info(std::format("Starting periodic sync every {} targeting http://{}:{}{}",
        duration::format(interval_), config_.target_host, config_.target_port, http::kSyncPath));
    sync_thread_ = std::thread(&PeriodicSyncScheduler::sync_loop, this);
}

void PeriodicSyncScheduler::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) return;

    { std::lock_guard lock(cv_mutex_); }
    cv_.notify_one();
    if (sync_thread_.joinable()) {
        sync_thread_.join();
    }
}

bool PeriodicSyncScheduler::trigger_once() {
    ticks_.fetch_add(1, std::memory_order_relaxed);

    httplib::Client cli(config_.target_host, config_.target_port);
    cli.set_connection_timeout(std::chrono::seconds(5));
    cli.set_read_timeout(config_.request_timeout);

    const auto res = cli.Post(http::kSyncPath, "", http::kJsonContentType);
    if (!res) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Periodic sync failed: {}", httplib::to_string(res.error())));
        return false;
    }
    if (res->status != httplib::StatusCode::OK_200) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Periodic sync failed with status code: {}, body: {}",
            res->status, utils::trim(res->body)));
        return false;
    }
    return true;
}

void PeriodicSyncScheduler::sync_loop() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, interval_, [this] {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) break;

        utils::log::info("Periodic sync triggered...");
        trigger_once();
    }
}

PeriodicSyncScheduler::Stats PeriodicSyncScheduler::get_stats() const {
    Stats s;
    s.ticks = ticks_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace bwproxy

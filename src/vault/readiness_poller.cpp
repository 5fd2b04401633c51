#include "vault/readiness_poller.hpp"
#include "vault/unlock_status.hpp"
#include "core/duration.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <thread>

namespace bwproxy {

ReadinessPoller::ReadinessPoller(ReadinessConfig config)
    : config_(std::move(config)) {}

std::string_view ReadinessPoller::check_name(Check check) {
    switch (check) {
        case Check::UNLOCKED:     return "unlocked";
        case Check::LOCKED:       return "locked";
        case Check::BAD_STATUS:   return "unexpected HTTP status";
        case Check::INVALID_BODY: return "invalid JSON body";
        case Check::UNREACHABLE:  return "unreachable";
    }
    return "unknown";
}

ReadinessPoller::Check ReadinessPoller::check_once() const {
    httplib::Client cli(config_.host, config_.port);
    cli.set_connection_timeout(config_.request_timeout);
    cli.set_read_timeout(config_.request_timeout);
    cli.set_write_timeout(config_.request_timeout);
    cli.set_max_timeout(config_.request_timeout);   // whole request, not per phase

    const auto res = cli.Get(config_.status_path);
    if (!res) {
        return Check::UNREACHABLE;
    }
    if (res->status != httplib::StatusCode::OK_200) {
        return Check::BAD_STATUS;
    }

    try {
        return is_unlocked(JsonValue::parse(res->body)) ? Check::UNLOCKED : Check::LOCKED;
    } catch (const JsonValue::parse_error&) {
        return Check::INVALID_BODY;
    }
}

Result<void> ReadinessPoller::wait_for_ready() {
    const auto& policy = config_.policy;
    utils::log::info(std::format(
        "Waiting for 'bw serve' on {}:{} to become ready and unlocked ({} attempts, every {})",
        config_.host, config_.port, policy.max_attempts, duration::format(policy.interval)));

    const utils::Timer timer;
    Check last = Check::UNREACHABLE;
    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        attempts_.fetch_add(1, std::memory_order_relaxed);
        last = check_once();

        if (last == Check::UNLOCKED) {
            utils::log::info(std::format("Vault unlocked after {} attempt(s), {}ms",
                attempt, timer.elapsed_ms().count()));
            return Result<void>::ok();
        }
        if (last == Check::UNREACHABLE) {
            unreachable_.fetch_add(1, std::memory_order_relaxed);
        } else if (last == Check::LOCKED) {
            locked_.fetch_add(1, std::memory_order_relaxed);
        }

        std::this_thread::sleep_for(policy.interval);
    }

    return Result<void>::error(ErrorCategory::TIMEOUT_ERROR, std::format(
        "timeout waiting for bw serve to become unlocked after {} attempts (last check: {})",
        policy.max_attempts, check_name(last)));
}

ReadinessPoller::Stats ReadinessPoller::get_stats() const {
    Stats s;
    s.attempts = attempts_.load(std::memory_order_relaxed);
    s.unreachable = unreachable_.load(std::memory_order_relaxed);
    s.locked = locked_.load(std::memory_order_relaxed);
    return s;
}

} // namespace bwproxy

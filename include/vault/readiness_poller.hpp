#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace bwproxy {

/**
 * @brief Blocks startup until bw serve reports an unlocked vault
 *
 * Issues GET http://<host>:<port>/status with a short per-request timeout,
 * up to policy.max_attempts times, sleeping policy.interval after every
 * attempt that is not unlocked. Network errors, non-200 responses and
 * invalid bodies all consume an attempt; there is no separate error budget.
 */
class ReadinessPoller {
public:
    enum class Check {
        UNLOCKED,
        LOCKED,          // 200 + valid JSON, but no unlocked marker
        BAD_STATUS,      // non-200
        INVALID_BODY,    // 200 but not JSON
        UNREACHABLE      // connect/read error or timeout
    };

    explicit ReadinessPoller(ReadinessConfig config);

    /**
     * @brief Poll until unlocked or the attempt budget is spent
     * @return ok on the first unlocked status check, TIMEOUT_ERROR otherwise
     */
    [[nodiscard]] Result<void> wait_for_ready();

    /// One status request, classified.
    [[nodiscard]] Check check_once() const;

    struct Stats {
        uint64_t attempts = 0;
        uint64_t unreachable = 0;
        uint64_t locked = 0;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] static std::string_view check_name(Check check);

private:
    const ReadinessConfig config_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> unreachable_{0};
    std::atomic<uint64_t> locked_{0};
};

} // namespace bwproxy

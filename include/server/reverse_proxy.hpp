#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
}

namespace bwproxy {

/**
 * @brief Single-host reverse proxy in front of bw serve
 *
 * Forwards method, raw target (path + query), headers and body. The inbound
 * Host header is preserved and X-Forwarded-For is appended. Hop-by-hop
 * headers are dropped in both directions. An unreachable upstream yields 502.
 */
class ReverseProxy {
public:
    struct Config {
        std::string host = "localhost";
        int port = 8088;
        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds read_timeout{120000};
    };

    explicit ReverseProxy(Config config);

    void forward(const httplib::Request& req, httplib::Response& res);

    struct Stats {
        uint64_t forwarded = 0;
        uint64_t upstream_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] static bool is_hop_by_hop(std::string_view header_name);

private:
    const Config config_;

    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> upstream_errors_{0};
};

} // namespace bwproxy

#include "server/reverse_proxy.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <array>
#include <format>

namespace bwproxy {

namespace {

// RFC 7230 hop-by-hop headers, plus Content-Length (recomputed by httplib)
// and the pseudo headers cpp-httplib attaches to inbound requests.
constexpr std::array<std::string_view, 14> kSkippedHeaders{
    "connection", "keep-alive", "proxy-connection", "proxy-authenticate",
    "proxy-authorization", "te", "trailer", "transfer-encoding", "upgrade",
    "content-length", "remote_addr", "remote_port", "local_addr", "local_port",
};

const std::string kForwardedFor = "X-Forwarded-For";

} // anonymous namespace

ReverseProxy::ReverseProxy(Config config)
    : config_(std::move(config)) {}

bool ReverseProxy::is_hop_by_hop(std::string_view header_name) {
    return std::ranges::any_of(kSkippedHeaders, [header_name](std::string_view skipped) {
        return utils::iequals(header_name, skipped);
    });
}

void ReverseProxy::forward(const httplib::Request& req, httplib::Response& res) {
    httplib::Client cli(config_.host, config_.port);
    cli.set_connection_timeout(config_.connect_timeout);
    cli.set_read_timeout(config_.read_timeout);
    cli.set_write_timeout(config_.read_timeout);
    cli.set_keep_alive(false);
    cli.set_url_encode(false);  // target is forwarded exactly as received
    cli.set_decompress(false);  // body and Content-Encoding travel together

    httplib::Request upstream;
    upstream.method = req.method;
    upstream.path = req.target.empty() ? req.path : req.target;
    for (const auto& [name, value] : req.headers) {
        if (!is_hop_by_hop(name)) {
            upstream.headers.emplace(name, value);
        }
    }

    std::string forwarded_for = req.get_header_value(kForwardedFor);
    if (!req.remote_addr.empty()) {
        forwarded_for = forwarded_for.empty()
            ? req.remote_addr
            : std::format("{}, {}", forwarded_for, req.remote_addr);
    }
    if (!forwarded_for.empty()) {
        upstream.headers.erase(kForwardedFor);
        upstream.headers.emplace(kForwardedFor, forwarded_for);
    }
    upstream.body = req.body;

    auto result = cli.send(upstream);
    if (!result) {
        upstream_errors_.fetch_add(1, std::memory_order_relaxed);
        const auto reason = httplib::to_string(result.error());
        utils::log::warn(std::format("Proxy error for {} {}: {}", req.method, req.path, reason));
        res.status = httplib::StatusCode::BadGateway_502;
        res.set_content(std::format("Bad Gateway: {}", reason), http::kTextContentType);
        return;
    }

    forwarded_.fetch_add(1, std::memory_order_relaxed);
    res.status = result->status;
    for (const auto& [name, value] : result->headers) {
        if (!is_hop_by_hop(name)) {
            res.headers.emplace(name, value);
        }
    }
    res.body = std::move(result->body);
}

ReverseProxy::Stats ReverseProxy::get_stats() const {
    Stats s;
    s.forwarded = forwarded_.load(std::memory_order_relaxed);
    s.upstream_errors = upstream_errors_.load(std::memory_order_relaxed);
    return s;
}

} // namespace bwproxy

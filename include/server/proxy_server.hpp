#pragma once

#include "config/config_types.hpp"
#include "server/reverse_proxy.hpp"
#include "server/route_table.hpp"

#include <atomic>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace bwproxy {

class SyncService;

/**
 * @brief Public HTTP front of the sidecar
 *
 * Route table:
 *   /healthz  any method  -> 200 "OK"
 *   /sync     POST        -> bw sync (200 "Sync successful" / 500 + command output)
 *   /sync     otherwise   -> 405
 *   *                     -> reverse proxy to bw serve
 *
 * Requests run concurrently on the httplib thread pool.
 */
class ProxyServer {
public:
    ProxyServer(ProxyConfig config, std::shared_ptr<SyncService> sync_service);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    /**
     * @brief Bind the listening socket. Port 0 picks an ephemeral port.
     * @return the bound port
     * @throws std::runtime_error when the address cannot be bound
     */
    int bind();

    /// Serve until stop(). Requires bind().
    void listen();

    /// bind() + listen()
    void start();
    void stop();

    /// Block until the accept loop is running.
    void wait_until_ready();

    [[nodiscard]] int port() const { return bound_port_.load(std::memory_order_acquire); }
    [[nodiscard]] const RouteTable& routes() const { return routes_; }
    [[nodiscard]] ReverseProxy::Stats proxy_stats() const { return proxy_.get_stats(); }

private:
    // ── Route registration (called from the constructor) ────────────────
    void register_routes(httplib::Server& svr);
    void dispatch(const httplib::Request& req, httplib::Response& res);

    // ── Handler methods (one per route kind) ────────────────────────────
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_sync(const httplib::Request& req, httplib::Response& res);
    void handle_method_not_allowed(const httplib::Request& req, httplib::Response& res);

    // ── Members ─────────────────────────────────────────────────────────
    const ProxyConfig config_;
    const RouteTable routes_;
    std::shared_ptr<SyncService> sync_service_;
    ReverseProxy proxy_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<int> bound_port_{-1};
};

} // namespace bwproxy

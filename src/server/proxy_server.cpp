#include "server/proxy_server.hpp"
#include "server/http_constants.hpp"
#include "sync/sync_service.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace bwproxy {

namespace {

ReverseProxy::Config upstream_config(const ProxyConfig& config) {
    ReverseProxy::Config upstream;
    upstream.host = config.backend_host;
    upstream.port = config.backend_port;
    upstream.connect_timeout = config.upstream_connect_timeout;
    upstream.read_timeout = config.upstream_read_timeout;
    return upstream;
}

} // anonymous namespace

ProxyServer::ProxyServer(ProxyConfig config, std::shared_ptr<SyncService> sync_service)
    : config_(std::move(config)),
      routes_({
          {http::kHealthPath, RouteKind::HEALTH},
          {http::kSyncPath, RouteKind::SYNC},
      }),
      sync_service_(std::move(sync_service)),
      proxy_(upstream_config(config_)),
      server_(std::make_unique<httplib::Server>()) {

    if (!sync_service_) {
        throw std::invalid_argument("ProxyServer requires a SyncService");
    }

    const size_t pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(*server_);
}

ProxyServer::~ProxyServer() = default;

// ============================================================================
// Lifecycle
// ============================================================================

int ProxyServer::bind() {
    int port = config_.port;
    if (port == 0) {
        port = server_->bind_to_any_port(config_.listen_host);
        if (port < 0) {
            throw std::runtime_error(std::format(
                "Failed to bind proxy server to {} on an ephemeral port", config_.listen_host));
        }
    } else if (!server_->bind_to_port(config_.listen_host, port)) {
        throw std::runtime_error(std::format(
            "Failed to bind proxy server to {}:{}", config_.listen_host, port));
    }
    bound_port_.store(port, std::memory_order_release);
    return port;
}

void ProxyServer::listen() {
    if (port() < 0) {
        throw std::logic_error("ProxyServer::listen() called before bind()");
    }
    utils::log::info(std::format("Starting proxy server on {}:{} -> {}:{} ({} threads)",
        config_.listen_host, port(), config_.backend_host, config_.backend_port,
        config_.thread_pool_size));

    if (!server_->listen_after_bind()) {
        throw std::runtime_error("Proxy server failed while accepting connections");
    }
}

void ProxyServer::start() {
    bind();
    listen();
}

void ProxyServer::stop() {
    server_->stop();
    utils::log::info("Proxy server stopped");
}

void ProxyServer::wait_until_ready() {
    server_->wait_until_ready();
}

// ============================================================================
// Route registration
// ============================================================================

void ProxyServer::register_routes(httplib::Server& svr) {
    // Every method funnels into dispatch(); the route table decides.
    const auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res);
    };
    const std::string any_path = ".*";
    svr.Get(any_path, handler);
    svr.Post(any_path, handler);
    svr.Put(any_path, handler);
    svr.Patch(any_path, handler);
    svr.Delete(any_path, handler);
    svr.Options(any_path, handler);

    // httplib answers 400 for methods without a registered handler (TRACE,
    // CONNECT), so /sync method rejection happens before routing.
    svr.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (routes_.resolve(req.path) == RouteKind::SYNC && req.method != "POST") {
            handle_method_not_allowed(req, res);
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });
}

void ProxyServer::dispatch(const httplib::Request& req, httplib::Response& res) {
    try {
        switch (routes_.resolve(req.path)) {
            case RouteKind::HEALTH:
                handle_health(req, res);
                return;
            case RouteKind::SYNC:
                if (req.method == "POST") {
                    handle_sync(req, res);
                } else {
                    handle_method_not_allowed(req, res);
                }
                return;
            case RouteKind::PROXY:
                proxy_.forward(req, res);
                return;
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Unhandled error for {} {}: {}", req.method, req.path, e.what()));
        res.status = httplib::StatusCode::InternalServerError_500;
        res.set_content("Internal Server Error", http::kTextContentType);
    }
}

// ============================================================================
// Handlers
// ============================================================================

void ProxyServer::handle_health(const httplib::Request&, httplib::Response& res) {
    res.status = httplib::StatusCode::OK_200;
    res.set_content(std::string(http::kHealthBody), http::kTextContentType);
}

void ProxyServer::handle_sync(const httplib::Request&, httplib::Response& res) {
    const auto outcome = sync_service_->run();
    if (!outcome.success) {
        // Command output goes back verbatim so operators can see why bw failed.
        res.status = httplib::StatusCode::InternalServerError_500;
        res.set_content(outcome.output, http::kTextContentType);
        return;
    }
    res.status = httplib::StatusCode::OK_200;
    res.set_content(std::string(http::kSyncSuccessBody), http::kTextContentType);
}

void ProxyServer::handle_method_not_allowed(const httplib::Request&, httplib::Response& res) {
    res.status = httplib::StatusCode::MethodNotAllowed_405;
    res.set_header("Allow", "POST");
    res.set_content(std::string(http::kMethodNotAllowedBody), http::kTextContentType);
}

} // namespace bwproxy

#pragma once

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <stdexcept>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace bwproxy::testing {

/**
 * @brief In-process HTTP server on an ephemeral 127.0.0.1 port
 *
 * Register handlers through server() before start(). Stops and joins on
 * destruction.
 */
class StubHttpServer {
public:
    StubHttpServer() = default;
    ~StubHttpServer() { stop(); }

    StubHttpServer(const StubHttpServer&) = delete;
    StubHttpServer& operator=(const StubHttpServer&) = delete;

    httplib::Server& server() { return server_; }

    int start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ < 0) {
            throw std::runtime_error("stub server failed to bind");
        }
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
        return port_;
    }

    void stop() {
        if (thread_.joinable()) {
            server_.stop();
            thread_.join();
        }
    }

    int port() const { return port_; }

    /// A port that was just bound and released: nothing listens there.
    static int closed_port() {
        const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (fd < 0 ||
            ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            if (fd >= 0) ::close(fd);
            throw std::runtime_error("could not reserve a port");
        }
        ::close(fd);
        return ntohs(addr.sin_port);
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
};

} // namespace bwproxy::testing

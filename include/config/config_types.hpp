#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace bwproxy {

// ============================================================================
// Configuration Types
// ============================================================================

struct VaultConfig {
    std::string cli = "bw";       // CLI binary, resolved via PATH
    std::string server_host;      // Custom server (empty = CLI default)
};

struct ServeConfig {
    std::string hostname = "0.0.0.0";
    int port = 8088;
};

/**
 * @brief Attempt budget for readiness polling. Attempts and errors share one counter.
 */
struct RetryPolicy {
    int max_attempts = 30;
    std::chrono::milliseconds interval{1000};
};

struct ReadinessConfig {
    std::string host = "127.0.0.1";
    int port = 8088;
    std::string status_path = "/status";
    RetryPolicy policy;
    std::chrono::milliseconds request_timeout{2000};
};

struct ProxyConfig {
    std::string listen_host = "0.0.0.0";
    int port = 8087;
    std::string public_host = "localhost";   // How the sidecar reaches itself
    std::string backend_host = "localhost";
    int backend_port = 8088;
    size_t thread_pool_size = 8;
    std::chrono::milliseconds upstream_connect_timeout{5000};
    std::chrono::milliseconds upstream_read_timeout{120000};
};

struct SyncConfig {
    bool enabled = true;
    std::string interval = "2m";              // Duration string, resolved by the scheduler
    std::string target_host = "localhost";
    int target_port = 8087;
    std::chrono::milliseconds request_timeout{300000};
};

struct SidecarConfig {
    VaultConfig vault;
    ServeConfig serve;
    ReadinessConfig readiness;
    ProxyConfig proxy;
    SyncConfig sync;
};

} // namespace bwproxy

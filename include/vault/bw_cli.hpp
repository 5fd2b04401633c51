#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bwproxy {

/**
 * @brief Argument grammar of the Bitwarden CLI
 *
 * Only builds argv vectors; running them is the CommandExecutor's job.
 */
class BwCli {
public:
    explicit BwCli(std::string binary = "bw") : binary_(std::move(binary)) {}

    [[nodiscard]] const std::string& binary() const { return binary_; }

    /// bw config server <host>
    [[nodiscard]] std::vector<std::string> config_server(const std::string& host) const;

    /// bw login --apikey (reads BW_CLIENTID / BW_CLIENTSECRET from the environment)
    [[nodiscard]] std::vector<std::string> login_apikey() const;

    /// bw unlock --passwordenv <VAR> --raw (prints the session key only)
    [[nodiscard]] std::vector<std::string> unlock_raw(std::string_view password_env) const;

    /// bw serve --hostname <h> --port <p> --session <token>
    [[nodiscard]] std::vector<std::string> serve(const std::string& hostname, int port,
                                                 const std::string& session) const;

    /// bw sync
    [[nodiscard]] std::vector<std::string> sync() const;

private:
    std::string binary_;
};

} // namespace bwproxy

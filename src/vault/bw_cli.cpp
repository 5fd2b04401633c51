#include "vault/bw_cli.hpp"

namespace bwproxy {

std::vector<std::string> BwCli::config_server(const std::string& host) const {
    return {binary_, "config", "server", host};
}

std::vector<std::string> BwCli::login_apikey() const {
    return {binary_, "login", "--apikey"};
}

std::vector<std::string> BwCli::unlock_raw(std::string_view password_env) const {
    return {binary_, "unlock", "--passwordenv", std::string(password_env), "--raw"};
}

std::vector<std::string> BwCli::serve(const std::string& hostname, int port,
                                      const std::string& session) const {
    return {binary_, "serve", "--hostname", hostname, "--port", std::to_string(port),
            "--session", session};
}

std::vector<std::string> BwCli::sync() const {
    return {binary_, "sync"};
}

} // namespace bwproxy

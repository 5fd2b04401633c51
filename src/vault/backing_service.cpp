#include "vault/backing_service.hpp"
#include "config/env_lookup.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace bwproxy {

BackingServiceLauncher::BackingServiceLauncher(
    VaultConfig vault, ServeConfig serve,
    CommandExecutor executor, ExitHandler on_exit)
    : serve_(std::move(serve)),
      cli_(vault.cli),
      executor_(std::move(executor)),
      on_exit_(std::move(on_exit)) {}

BackingServiceLauncher::~BackingServiceLauncher() {
    if (serve_thread_.joinable()) {
        serve_thread_.join();
    }
}

CommandSpec BackingServiceLauncher::build_spec(const std::string& session) const {
    CommandSpec spec;
    spec.argv = cli_.serve(serve_.hostname, serve_.port, session);
    spec.env = {{std::string(env::kSession), session}};
    spec.output = OutputMode::INHERIT;
    spec.die_with_parent = true;
    return spec;
}

void BackingServiceLauncher::start(const std::string& session) {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        throw std::logic_error("bw serve already started");
    }

    auto spec = build_spec(session);
    utils::log::info(std::format("Starting 'bw serve' on internal port {}: {}",
        serve_.port, format_command(spec.argv)));

    running_.store(true, std::memory_order_release);
    serve_thread_ = std::thread(&BackingServiceLauncher::run, this, std::move(spec));
}

void BackingServiceLauncher::run(CommandSpec spec) {
    const auto result = executor_(spec);
    running_.store(false, std::memory_order_release);

    if (!result.spawned) {
        utils::log::error(std::format("'bw serve' could not be started: {}", result.describe()));
    } else {
        utils::log::error(std::format("'bw serve' process exited: {}", result.describe()));
    }
    if (on_exit_) {
        on_exit_(result);
    }
}

} // namespace bwproxy

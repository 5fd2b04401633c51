#include <catch2/catch_test_macros.hpp>
#include "vault/auth_sequencer.hpp"
#include "mocks/mock_command_executor.hpp"

using namespace bwproxy;
using testing::MockCommandExecutor;
using testing::env_override;

namespace {

EnvLookup full_env() {
    return static_env({
        {"BW_CLIENTID", "user.1234"},
        {"BW_CLIENTSECRET", "client-secret"},
        {"BW_PASSWORD", "master-password"},
    });
}

} // anonymous namespace

TEST_CASE("AuthSequencer: login then unlock returns trimmed session", "[auth]") {
    MockCommandExecutor mock;
    mock.on("login", 0, "You are logged in!");
    mock.on("unlock", 0, "  c2Vzc2lvbi1rZXk=\n");

    AuthSequencer seq(VaultConfig{}, mock.as_executor(), full_env());
    const auto result = seq.login_and_get_session();

    REQUIRE(result.is_ok());
    CHECK(result.value() == "c2Vzc2lvbi1rZXk=");

    const auto calls = mock.calls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].argv == std::vector<std::string>{"bw", "login", "--apikey"});
    CHECK(calls[1].argv == std::vector<std::string>{"bw", "unlock", "--passwordenv", "BW_PASSWORD", "--raw"});
}

TEST_CASE("AuthSequencer: secrets are forwarded to the step that needs them", "[auth]") {
    MockCommandExecutor mock;
    mock.on("unlock", 0, "token");

    AuthSequencer seq(VaultConfig{}, mock.as_executor(), full_env());
    REQUIRE(seq.login_and_get_session().is_ok());

    const auto calls = mock.calls();
    REQUIRE(calls.size() == 2);
    CHECK(env_override(calls[0], "BW_CLIENTID") == "user.1234");
    CHECK(env_override(calls[0], "BW_CLIENTSECRET") == "client-secret");
    CHECK(env_override(calls[0], "BW_PASSWORD").empty());
    CHECK(env_override(calls[1], "BW_PASSWORD") == "master-password");
    CHECK(env_override(calls[1], "BW_CLIENTSECRET").empty());
}

TEST_CASE("AuthSequencer: custom server is configured first", "[auth]") {
    MockCommandExecutor mock;
    mock.on("unlock", 0, "token");

    VaultConfig vault;
    vault.server_host = "https://vault.example.com";
    AuthSequencer seq(vault, mock.as_executor(), full_env());
    REQUIRE(seq.login_and_get_session().is_ok());

    const auto calls = mock.calls();
    REQUIRE(calls.size() == 3);
    CHECK(calls[0].argv == std::vector<std::string>{"bw", "config", "server", "https://vault.example.com"});
    CHECK(calls[1].argv[1] == "login");
    CHECK(calls[2].argv[1] == "unlock");
}

TEST_CASE("AuthSequencer: custom CLI binary", "[auth]") {
    MockCommandExecutor mock;
    mock.on("unlock", 0, "token");

    VaultConfig vault;
    vault.cli = "/opt/bw/bin/bw";
    AuthSequencer seq(vault, mock.as_executor(), full_env());
    REQUIRE(seq.login_and_get_session().is_ok());
    for (const auto& call : mock.calls()) {
        CHECK(call.argv[0] == "/opt/bw/bin/bw");
    }
}

TEST_CASE("AuthSequencer: login failure stops the sequence", "[auth]") {
    MockCommandExecutor mock;
    mock.on("login", 1, "Invalid API key\n");

    AuthSequencer seq(VaultConfig{}, mock.as_executor(), full_env());
    const auto result = seq.login_and_get_session();

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::COMMAND_ERROR);
    CHECK(result.error_message() == "bw login failed: Invalid API key - exit status 1");
    CHECK(result.failure().describe() == "command error: bw login failed: Invalid API key - exit status 1");
    CHECK(mock.call_count("unlock") == 0);
}

TEST_CASE("AuthSequencer: unlock failure", "[auth]") {
    MockCommandExecutor mock;
    mock.on("unlock", 1, "Invalid master password.");

    AuthSequencer seq(VaultConfig{}, mock.as_executor(), full_env());
    const auto result = seq.login_and_get_session();

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::COMMAND_ERROR);
    CHECK(result.error_message().find("bw unlock failed") == 0);
    CHECK(result.error_message().find("Invalid master password.") != std::string::npos);
}

TEST_CASE("AuthSequencer: server configuration failure", "[auth]") {
    MockCommandExecutor mock;
    mock.on("config", 2, "bad url");

    VaultConfig vault;
    vault.server_host = "not a url";
    AuthSequencer seq(vault, mock.as_executor(), full_env());
    const auto result = seq.login_and_get_session();

    REQUIRE(result.is_error());
    CHECK(result.error_message() == "bw config server failed: bad url - exit status 2");
    CHECK(mock.call_count("login") == 0);
}

TEST_CASE("AuthSequencer: empty session key is an error", "[auth]") {
    MockCommandExecutor mock;
    mock.on("unlock", 0, " \n");

    AuthSequencer seq(VaultConfig{}, mock.as_executor(), full_env());
    const auto result = seq.login_and_get_session();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::COMMAND_ERROR);
}

TEST_CASE("AuthSequencer: missing secrets are reported before any command", "[auth]") {
    MockCommandExecutor mock;
    AuthSequencer seq(VaultConfig{}, mock.as_executor(),
                      static_env({{"BW_CLIENTID", "user.1234"}, {"BW_CLIENTSECRET", ""}}));
    const auto result = seq.login_and_get_session();

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    CHECK(result.error_message().find("BW_CLIENTSECRET") != std::string::npos);
    CHECK(result.error_message().find("BW_PASSWORD") != std::string::npos);
    CHECK(result.error_message().find("BW_CLIENTID") == std::string::npos);
    CHECK(mock.calls().empty());
}

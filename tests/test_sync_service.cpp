#include <catch2/catch_test_macros.hpp>
#include "sync/sync_service.hpp"
#include "mocks/mock_command_executor.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace bwproxy;
using namespace std::chrono_literals;
using testing::MockCommandExecutor;
using testing::env_override;

TEST_CASE("SyncService: successful sync", "[sync]") {
    MockCommandExecutor mock;
    mock.on("sync", 0, "Syncing complete.");

    SyncService service(BwCli{}, mock.as_executor(), "tok");
    const auto outcome = service.run();

    CHECK(outcome.success);
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.output == "Syncing complete.");
    CHECK(service.get_stats().runs == 1);
    CHECK(service.get_stats().failures == 0);
}

TEST_CASE("SyncService: failing sync keeps the raw output", "[sync]") {
    MockCommandExecutor mock;
    mock.on("sync", 1, "You are not logged in.\n");

    SyncService service(BwCli{}, mock.as_executor(), "tok");
    const auto outcome = service.run();

    CHECK_FALSE(outcome.success);
    CHECK(outcome.exit_code == 1);
    CHECK(outcome.output == "You are not logged in.\n");
    CHECK(service.get_stats().failures == 1);
}

TEST_CASE("SyncService: session is passed to the CLI", "[sync]") {
    MockCommandExecutor mock;
    SyncService service(BwCli{"/usr/bin/bw"}, mock.as_executor(), "session-key");
    (void)service.run();

    const auto calls = mock.calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].argv == std::vector<std::string>{"/usr/bin/bw", "sync"});
    CHECK(env_override(calls[0], "BW_SESSION") == "session-key");
    CHECK(calls[0].output == OutputMode::CAPTURE);
}

TEST_CASE("SyncService: concurrent callers are serialized", "[sync]") {
    MockCommandExecutor mock;
    mock.set_delay(30ms);
    SyncService service(BwCli{}, mock.as_executor(), "tok");

    std::vector<std::thread> threads;
    std::vector<SyncOutcome> outcomes(4);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        threads.emplace_back([&service, &outcomes, i] { outcomes[i] = service.run(); });
    }
    for (auto& t : threads) t.join();

    CHECK(mock.max_concurrency() == 1);
    CHECK(mock.call_count("sync") == 4);
    CHECK(service.get_stats().runs == 4);
    for (const auto& outcome : outcomes) {
        CHECK(outcome.success);
    }
}

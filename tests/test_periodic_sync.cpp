#include <catch2/catch_test_macros.hpp>
#include "sync/periodic_sync.hpp"
#include "mocks/stub_http_server.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace bwproxy;
using namespace std::chrono_literals;
using testing::StubHttpServer;

namespace {

SyncConfig config_for(int port, std::string interval) {
    SyncConfig cfg;
    cfg.enabled = true;
    cfg.interval = std::move(interval);
    cfg.target_host = "127.0.0.1";
    cfg.target_port = port;
    cfg.request_timeout = 2s;
    return cfg;
}

template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} // anonymous namespace

TEST_CASE("PeriodicSync: interval resolution", "[periodic_sync]") {
    CHECK(PeriodicSyncScheduler::resolve_interval("2m") == 2min);
    CHECK(PeriodicSyncScheduler::resolve_interval("30s") == 30s);
    CHECK(PeriodicSyncScheduler::resolve_interval("1.5s") == 1500ms);
    CHECK(PeriodicSyncScheduler::resolve_interval("1h") == 1h);
}

TEST_CASE("PeriodicSync: invalid interval falls back to two minutes", "[periodic_sync]") {
    CHECK(PeriodicSyncScheduler::resolve_interval("banana") == 2min);
    CHECK(PeriodicSyncScheduler::resolve_interval("") == 2min);
    CHECK(PeriodicSyncScheduler::resolve_interval("10") == 2min);
    CHECK(PeriodicSyncScheduler::resolve_interval("0s") == 2min);
    CHECK(PeriodicSyncScheduler::resolve_interval("-5s") == 2min);

    PeriodicSyncScheduler scheduler(config_for(1, "banana"));
    CHECK(scheduler.interval() == PeriodicSyncScheduler::kDefaultInterval);
}

TEST_CASE("PeriodicSync: interval longer than a year falls back to two minutes", "[periodic_sync]") {
    CHECK(PeriodicSyncScheduler::resolve_interval("8760h") == 8760h);
    CHECK(PeriodicSyncScheduler::resolve_interval("8761h") == 2min);
    CHECK(PeriodicSyncScheduler::resolve_interval("2500000h") == 2min);
    CHECK(PeriodicSyncScheduler::resolve_interval("2600000h") == 2min);

    // the scheduler must still stop promptly with the fallback in place
    PeriodicSyncScheduler scheduler(config_for(1, "2500000h"));
    CHECK(scheduler.interval() == PeriodicSyncScheduler::kDefaultInterval);
    scheduler.start();
    CHECK(scheduler.is_running());
    scheduler.stop();
    CHECK_FALSE(scheduler.is_running());
}

TEST_CASE("PeriodicSync: ticks POST to /sync", "[periodic_sync]") {
    StubHttpServer stub;
    std::atomic<int> posts{0};
    stub.server().Post("/sync", [&posts](const httplib::Request&, httplib::Response& res) {
        ++posts;
        res.set_content("Sync successful", "text/plain");
    });
    stub.start();

    PeriodicSyncScheduler scheduler(config_for(stub.port(), "50ms"));
    scheduler.start();
    CHECK(scheduler.is_running());

    CHECK(eventually([&posts] { return posts.load() >= 2; }));
    scheduler.stop();
    CHECK_FALSE(scheduler.is_running());

    const auto stats = scheduler.get_stats();
    CHECK(stats.ticks >= 2);
    CHECK(stats.failures == 0);
}

TEST_CASE("PeriodicSync: first tick waits one interval", "[periodic_sync]") {
    StubHttpServer stub;
    std::atomic<int> posts{0};
    stub.server().Post("/sync", [&posts](const httplib::Request&, httplib::Response&) { ++posts; });
    stub.start();

    PeriodicSyncScheduler scheduler(config_for(stub.port(), "10s"));
    scheduler.start();
    std::this_thread::sleep_for(100ms);
    scheduler.stop();

    CHECK(posts.load() == 0);
    CHECK(scheduler.get_stats().ticks == 0);
}

TEST_CASE("PeriodicSync: failures are counted and the loop continues", "[periodic_sync]") {
    StubHttpServer stub;
    std::atomic<int> posts{0};
    stub.server().Post("/sync", [&posts](const httplib::Request&, httplib::Response& res) {
        ++posts;
        res.status = 500;
        res.set_content("You are not logged in.", "text/plain");
    });
    stub.start();

    PeriodicSyncScheduler scheduler(config_for(stub.port(), "30ms"));
    scheduler.start();
    CHECK(eventually([&posts] { return posts.load() >= 3; }));
    scheduler.stop();

    CHECK(scheduler.get_stats().failures >= 3);
}

TEST_CASE("PeriodicSync: trigger_once", "[periodic_sync]") {
    SECTION("success") {
        StubHttpServer stub;
        stub.server().Post("/sync", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("Sync successful", "text/plain");
        });
        stub.start();

        PeriodicSyncScheduler scheduler(config_for(stub.port(), "2m"));
        CHECK(scheduler.trigger_once());
        CHECK(scheduler.get_stats().failures == 0);
    }
    SECTION("endpoint unreachable") {
        PeriodicSyncScheduler scheduler(config_for(StubHttpServer::closed_port(), "2m"));
        CHECK_FALSE(scheduler.trigger_once());
        CHECK(scheduler.get_stats().failures == 1);
    }
}

TEST_CASE("PeriodicSync: disabled scheduler never starts", "[periodic_sync]") {
    auto cfg = config_for(1, "10ms");
    cfg.enabled = false;
    PeriodicSyncScheduler scheduler(cfg);
    scheduler.start();
    CHECK_FALSE(scheduler.is_running());
    std::this_thread::sleep_for(50ms);
    CHECK(scheduler.get_stats().ticks == 0);
}

TEST_CASE("PeriodicSync: start and stop are idempotent", "[periodic_sync]") {
    PeriodicSyncScheduler scheduler(config_for(StubHttpServer::closed_port(), "1h"));
    scheduler.start();
    scheduler.start();
    CHECK(scheduler.is_running());
    scheduler.stop();
    scheduler.stop();
    CHECK_FALSE(scheduler.is_running());
}

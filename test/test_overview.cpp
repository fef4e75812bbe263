#include <catch2/catch.hpp>

#include "sichter/event_log.hpp"
#include "sichter/overview.hpp"
#include "sichter/queue.hpp"
#include "test_helpers.hpp"

using namespace sichter;

namespace {
class StaticProbe final : public WorkerProbe {
public:
    explicit StaticProbe(WorkerStatus status) : status_(std::move(status)) {}
    WorkerStatus status() noexcept override { return status_; }

private:
    WorkerStatus status_;
};

class BrokenProbe final : public WorkerProbe {
public:
    // Mimics a probe whose backend is missing
    WorkerStatus status() noexcept override { return WorkerStatus{}; }
};
}

TEST_CASE("systemctl show output maps onto WorkerStatus", "[overview]") {
    auto status = SystemdProbe::parse(
        "ActiveState=active\n"
        "SubState=running\n"
        "MainPID=4242\n"
        "ActiveEnterTimestamp=Sat 2025-03-01 12:00:00 CET\n"
        "ExecMainExitTimestamp=\n");

    CHECK(status.activeState == "active");
    CHECK(status.subState == "running");
    CHECK(status.mainPid == std::optional<long>(4242));
    CHECK(status.since == std::optional<std::string>("Sat 2025-03-01 12:00:00 CET"));
    CHECK_FALSE(status.lastExit.has_value());

    SECTION("a stopped unit reports no pid") {
        auto stopped = SystemdProbe::parse("ActiveState=inactive\nSubState=dead\nMainPID=0\n");
        CHECK(stopped.activeState == "inactive");
        CHECK_FALSE(stopped.mainPid.has_value());
    }

    SECTION("empty output leaves everything unknown") {
        auto unknown = SystemdProbe::parse("");
        CHECK(unknown.activeState == "unknown");
        CHECK(unknown.subState == "unknown");
    }
}

TEST_CASE("Overview combines worker, queue and recent events", "[overview]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    Queue queue(config);
    EventLog log(config.eventLogPath());

    JobSpec spec;
    spec.type = "ScanAll";
    REQUIRE(queue.submit(spec).ok);
    REQUIRE(queue.submit(spec).ok);
    for (int i = 0; i < 5; ++i) {
        log.append("debug");
    }

    WorkerStatus running;
    running.activeState = "active";
    running.subState = "running";
    running.mainPid = 99;
    StaticProbe probe(running);
    Overview overview(queue, log, probe, 3);

    auto snap = overview.snapshot();
    CHECK(snap.worker.activeState == "active");
    CHECK(snap.queue.size == 2);
    CHECK(snap.queue.items.size() == 2);
    REQUIRE(snap.events.size() == 3);
    CHECK(snap.events.back().seq == 5);

    auto json = toJson(snap);
    CHECK(json["worker"]["mainPID"] == 99);
    CHECK(json["worker"]["since"].is_null());
    CHECK(json["queue"]["size"] == 2);
    CHECK(json["queue"]["items"][0]["type"] == "ScanAll");
    CHECK(json["events"].size() == 3);
}

TEST_CASE("Overview degrades part by part", "[overview]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    Queue queue(config);
    EventLog log(config.eventLogPath());
    log.append("debug");
    BrokenProbe probe;
    Overview overview(queue, log, probe, 10);

    SECTION("probe failure still returns queue and events") {
        JobSpec spec;
        spec.type = "PRSweep";
        REQUIRE(queue.submit(spec).ok);
        auto snap = overview.snapshot();
        CHECK(snap.worker.activeState == "unknown");
        CHECK(snap.queue.size == 1);
        CHECK(snap.events.size() == 1);
    }

    SECTION("a missing queue directory empties only the queue part") {
        std::filesystem::remove_all(config.queueDir());
        auto snap = overview.snapshot();
        CHECK(snap.queue.size == 0);
        CHECK(snap.queue.items.empty());
        CHECK(snap.events.size() == 1);
    }
}

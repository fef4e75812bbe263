#include <catch2/catch.hpp>

#include <algorithm>

#include "sichter/event_log.hpp"
#include "sichter/queue.hpp"
#include "sichter/worker.hpp"
#include "test_helpers.hpp"

using namespace sichter;

namespace {
std::vector<Event> eventsFor(const EventLog& log, const JobId& id) {
    std::vector<Event> out;
    for (auto& event : log.tail(1000).events) {
        if (eventJobId(event) == id) {
            out.push_back(std::move(event));
        }
    }
    return out;
}

std::size_t countKind(const std::vector<Event>& events, const std::string& kind) {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(),
                                                  [&](const Event& e) { return e.kind == kind; }));
}
}

TEST_CASE("A submitted scan is processed, logged and removed", "[worker]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    Queue queue(config);
    EventLog log(config.eventLogPath());
    test::FakeCheckRunner checks;
    test::FakePrPublisher publisher;
    Worker worker(config, queue, log, checks, publisher);

    JobSpec spec;
    spec.type = "ScanChanged";
    spec.mode = "changed";
    spec.repo = "org/x";
    auto submitted = queue.submit(spec);
    REQUIRE(submitted.ok);
    CHECK(queue.size() == 1);

    REQUIRE(worker.runOnce());
    CHECK(queue.size() == 0);
    CHECK_FALSE(worker.runOnce());

    auto events = eventsFor(log, submitted.id);
    REQUIRE(events.size() >= 2);
    CHECK(events.front().kind == "job.started");
    CHECK(events.back().kind == "job.done");
    CHECK(countKind(events, "job.done") == 1);

    REQUIRE(checks.calls.size() == 1);
    CHECK(checks.calls[0].first == "org/x");
    CHECK(checks.calls[0].second == ScanMode::Changed);
    REQUIRE(publisher.calls.size() == 1);
    CHECK(publisher.calls[0] == std::vector<std::string>{"org/x"});
    CHECK(worker.processed() == 1);
    CHECK(worker.failed() == 0);
}

TEST_CASE("A failing collaborator yields exactly one job.failed and no retry", "[worker]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    Queue queue(config);
    EventLog log(config.eventLogPath());
    test::FakeCheckRunner checks;
    test::FakePrPublisher publisher;
    Worker worker(config, queue, log, checks, publisher);

    JobSpec spec;
    spec.type = "ScanChanged";
    spec.repo = "org/broken";

    SECTION("reported failure") {
        checks.failRepo = "org/broken";
    }
    SECTION("thrown exception") {
        checks.throwError = true;
    }

    auto submitted = queue.submit(spec);
    REQUIRE(submitted.ok);
    REQUIRE(worker.runOnce());
    CHECK_FALSE(worker.runOnce());

    auto events = eventsFor(log, submitted.id);
    CHECK(countKind(events, "job.started") == 1);
    CHECK(countKind(events, "job.failed") == 1);
    CHECK(countKind(events, "job.done") == 0);
    CHECK(events.back().kind == "job.failed");
    CHECK_FALSE(events.back().payload.value("error", std::string()).empty());

    CHECK(queue.size() == 0);
    CHECK(checks.calls.size() == 1);
    CHECK(publisher.calls.empty());
    CHECK(worker.failed() == 1);
}

TEST_CASE("Scans fan out over the configured repository set", "[worker]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    config.repos = {"org/a", "org/b", "org/c"};
    Queue queue(config);
    EventLog log(config.eventLogPath());
    test::FakeCheckRunner checks;
    checks.failRepo = "org/b";
    test::FakePrPublisher publisher;
    Worker worker(config, queue, log, checks, publisher);

    JobSpec spec;
    spec.type = "ScanAll";
    spec.mode = "changed";
    spec.autoPr = false;
    auto submitted = queue.submit(spec);
    REQUIRE(submitted.ok);
    REQUIRE(worker.runOnce());

    REQUIRE(checks.calls.size() == 3);
    for (const auto& call : checks.calls) {
        CHECK(call.second == ScanMode::All);
    }
    CHECK(publisher.calls.empty());

    auto events = eventsFor(log, submitted.id);
    CHECK(countKind(events, "job.progress") == 3);
    REQUIRE(events.back().kind == "job.failed");
    CHECK(events.back().payload["error"].get<std::string>().find("org/b") != std::string::npos);
}

TEST_CASE("A scan without any target repository still completes", "[worker]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    Queue queue(config);
    EventLog log(config.eventLogPath());
    test::FakeCheckRunner checks;
    test::FakePrPublisher publisher;
    Worker worker(config, queue, log, checks, publisher);

    JobSpec spec;
    spec.type = "ScanChanged";
    auto submitted = queue.submit(spec);
    REQUIRE(submitted.ok);
    REQUIRE(worker.runOnce());

    CHECK(checks.calls.empty());
    CHECK(eventsFor(log, submitted.id).back().kind == "job.done");
}

TEST_CASE("PRSweep publishes the whole repository set at once", "[worker]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    config.repos = {"org/a", "org/b"};
    Queue queue(config);
    EventLog log(config.eventLogPath());
    test::FakeCheckRunner checks;
    test::FakePrPublisher publisher;
    Worker worker(config, queue, log, checks, publisher);

    JobSpec spec;
    spec.type = "PRSweep";
    REQUIRE(queue.submit(spec).ok);
    REQUIRE(worker.runOnce());

    CHECK(checks.calls.empty());
    REQUIRE(publisher.calls.size() == 1);
    CHECK(publisher.calls[0] == config.repos);
}

TEST_CASE("The background loop drains the queue and brackets itself with events", "[worker]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    Queue queue(config);
    EventLog log(config.eventLogPath());
    test::FakeCheckRunner checks;
    test::FakePrPublisher publisher;
    Worker worker(config, queue, log, checks, publisher);

    REQUIRE(worker.start());
    CHECK_FALSE(worker.start());

    JobSpec spec;
    spec.type = "ScanChanged";
    spec.repo = "org/x";
    for (int i = 0; i < 3; ++i) {
        REQUIRE(queue.submit(spec).ok);
    }

    CHECK(test::waitUntil([&] { return worker.processed() == 3; }));
    worker.stop();
    CHECK_FALSE(worker.isRunning());
    CHECK_FALSE(worker.fatalError().has_value());

    auto events = log.tail(100).events;
    REQUIRE_FALSE(events.empty());
    CHECK(events.front().kind == "worker.start");
    CHECK(events.back().kind == "worker.stop");
    CHECK(queue.size() == 0);
}

TEST_CASE("An unwritable event log stops the loop without losing the job", "[worker]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    Queue queue(config);
    // A directory where the log file should be makes every append fail
    std::filesystem::create_directories(config.eventLogPath());
    EventLog log(config.eventLogPath());
    test::FakeCheckRunner checks;
    test::FakePrPublisher publisher;
    Worker worker(config, queue, log, checks, publisher);

    JobSpec spec;
    spec.type = "ScanChanged";
    spec.repo = "org/x";
    REQUIRE(queue.submit(spec).ok);

    CHECK_THROWS_AS((void)worker.runOnce(), StorageError);
    CHECK(queue.size() == 1);

    REQUIRE(worker.start());
    CHECK(test::waitUntil([&] { return !worker.isRunning(); }));
    worker.stop();
    CHECK(worker.fatalError().has_value());
}

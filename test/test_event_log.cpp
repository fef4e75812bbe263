#include <catch2/catch.hpp>

#include <fstream>
#include <thread>

#include "sichter/event_log.hpp"
#include "test_helpers.hpp"

using namespace sichter;

TEST_CASE("Appends are numbered and read back in order", "[event_log]") {
    test::TempDir dir;
    EventLog log(dir.path() / "events" / "events.jsonl");

    CHECK(log.tail(10).events.empty());

    for (int i = 0; i < 5; ++i) {
        auto event = log.append("debug", {{"i", i}}, "line " + std::to_string(i));
        CHECK(event.seq == static_cast<std::uint64_t>(i + 1));
    }

    auto batch = log.tail(3);
    REQUIRE(batch.events.size() == 3);
    CHECK(batch.events[0].seq == 3);
    CHECK(batch.events[2].seq == 5);
    CHECK(batch.events[2].line == std::optional<std::string>("line 4"));
    CHECK(batch.offset == log.size());

    CHECK(log.tail(100).events.size() == 5);
    CHECK(log.tail(0).events.empty());
}

TEST_CASE("readFrom resumes exactly after a tail snapshot", "[event_log]") {
    test::TempDir dir;
    EventLog log(dir.path() / "events.jsonl");
    for (int i = 0; i < 4; ++i) {
        log.append("debug");
    }

    auto snapshot = log.tail(2);
    REQUIRE(snapshot.events.back().seq == 4);

    log.append("job.started", {{"job_id", "x"}});
    log.append("job.done", {{"job_id", "x"}});

    auto live = log.readFrom(snapshot.offset);
    REQUIRE(live.events.size() == 2);
    CHECK(live.events[0].seq == 5);
    CHECK(live.events[1].seq == 6);
    CHECK(live.offset == log.size());
    CHECK(log.readFrom(live.offset).events.empty());
}

TEST_CASE("Readers never see a partial trailing line", "[event_log]") {
    test::TempDir dir;
    auto path = dir.path() / "events.jsonl";
    {
        EventLog log(path);
        log.append("debug");
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"seq\":2,\"ts\":\"2025-03-01T12:00:00.000Z\",\"ki";
    }

    EventLog reader(path);
    auto all = reader.readFrom(0);
    CHECK(all.events.size() == 1);
    CHECK(all.offset < reader.size());

    SECTION("the next writer seals the torn line and continues the sequence") {
        EventLog writer(path);
        auto event = writer.append("worker.start");
        CHECK(event.seq == 2);
        auto events = writer.tail(10).events;
        REQUIRE(events.size() == 2);
        CHECK(events.back().kind == "worker.start");
    }
}

TEST_CASE("Sequence numbers continue across reopen", "[event_log]") {
    test::TempDir dir;
    auto path = dir.path() / "events.jsonl";
    {
        EventLog log(path);
        log.append("worker.start");
        log.append("worker.stop");
    }
    EventLog log(path);
    CHECK(log.append("worker.start").seq == 3);
}

TEST_CASE("waitForAppend wakes on a new line and times out otherwise", "[event_log]") {
    test::TempDir dir;
    EventLog log(dir.path() / "events.jsonl");
    log.append("debug");
    std::uint64_t offset = log.tail(1).offset;

    CHECK_FALSE(log.waitForAppend(offset, std::chrono::milliseconds(50)));

    std::thread writer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        log.append("job.started");
    });
    CHECK(log.waitForAppend(offset, std::chrono::milliseconds(2000)));
    writer.join();

    SECTION("a reader instance sees appends made through another instance") {
        EventLog reader(log.path());
        auto before = reader.tail(1).offset;
        log.append("job.done");
        CHECK(reader.waitForAppend(before, std::chrono::milliseconds(500)));
        CHECK(reader.readFrom(before).events.front().kind == "job.done");
    }
}

TEST_CASE("Large logs are tailed without reading everything", "[event_log]") {
    test::TempDir dir;
    EventLog log(dir.path() / "events.jsonl");
    std::string padding(300, 'x');
    for (int i = 0; i < 600; ++i) {
        log.append("debug", {{"pad", padding}});
    }
    auto batch = log.tail(250);
    REQUIRE(batch.events.size() == 250);
    CHECK(batch.events.front().seq == 351);
    CHECK(batch.events.back().seq == 600);
}

#include <catch2/catch.hpp>

#include "sichter/event.hpp"
#include "sichter/types.hpp"

using namespace sichter;

TEST_CASE("Job types and modes parse from their wire names", "[types]") {
    CHECK(parseJobType("ScanChanged") == JobType::ScanChanged);
    CHECK(parseJobType("ScanAll") == JobType::ScanAll);
    CHECK(parseJobType("PRSweep") == JobType::PRSweep);
    CHECK_FALSE(parseJobType("scanchanged").has_value());
    CHECK_FALSE(parseJobType("").has_value());

    CHECK(parseScanMode("changed") == ScanMode::Changed);
    CHECK(parseScanMode("all") == ScanMode::All);
    CHECK_FALSE(parseScanMode("some").has_value());

    CHECK(std::string(toString(JobType::PRSweep)) == "PRSweep");
    CHECK(std::string(toString(ScanMode::All)) == "all");
    CHECK(std::string(toString(ErrorKind::Storage)) == "storage");
}

TEST_CASE("Timestamps format as UTC with milliseconds", "[types]") {
    Timestamp ts{std::chrono::milliseconds(1740830400250)};
    CHECK(formatTimestamp(ts) == "2025-03-01T12:00:00.250Z");

    auto parsed = parseTimestamp("2025-03-01T12:00:00.250Z");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == ts);

    SECTION("offset form and missing fraction are accepted") {
        auto plain = parseTimestamp("2025-03-01T12:00:00+00:00");
        REQUIRE(plain.has_value());
        CHECK(*plain == Timestamp{std::chrono::seconds(1740830400)});
    }

    SECTION("non-UTC zones and garbage are rejected") {
        CHECK_FALSE(parseTimestamp("2025-03-01T12:00:00+02:00").has_value());
        CHECK_FALSE(parseTimestamp("yesterday").has_value());
    }
}

TEST_CASE("Event lines carry seq, ts, kind and optional fields", "[types][event]") {
    Event event;
    event.seq = 7;
    event.ts = Timestamp{std::chrono::milliseconds(1740830400000)};
    event.kind = "job.done";
    event.payload = {{"job_id", "00001740830400000_1_0"}};

    auto json = toJson(event);
    CHECK(json["seq"] == 7);
    CHECK(json["kind"] == "job.done");
    CHECK_FALSE(json.contains("line"));

    auto back = parseEventLine(json.dump());
    REQUIRE(back.has_value());
    CHECK(back->seq == 7);
    CHECK(back->ts == event.ts);
    CHECK(eventJobId(*back) == "00001740830400000_1_0");

    CHECK_FALSE(parseEventLine("{\"seq\":1}").has_value());
    CHECK_FALSE(parseEventLine("{not json").has_value());
    CHECK(eventJobId(Event{}).empty());
}

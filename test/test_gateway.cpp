#include <catch2/catch.hpp>

#include <fstream>
#include <functional>
#include <iterator>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "sichter/event_log.hpp"
#include "sichter/gateway.hpp"
#include "sichter/overview.hpp"
#include "sichter/queue.hpp"
#include "sichter/stream_client.hpp"
#include "test_helpers.hpp"

using namespace sichter;

namespace {
class IdleProbe final : public WorkerProbe {
public:
    WorkerStatus status() noexcept override {
        WorkerStatus status;
        status.activeState = "active";
        status.subState = "running";
        return status;
    }
};

Config tuned(const std::filesystem::path& dir, const std::function<void(Config&)>& tweak) {
    Config config = test::testConfig(dir);
    if (tweak) {
        tweak(config);
    }
    return config;
}

// A running gateway over a fresh state directory.
struct GatewayFixture {
    explicit GatewayFixture(const std::function<void(Config&)>& tweak = nullptr)
        : config(tuned(dir.path(), tweak)),
          queue(config),
          log(config.eventLogPath()),
          overview(queue, log, probe, config.overviewEvents),
          gateway(config, queue, log, overview) {
        if (!gateway.start()) {
            throw std::runtime_error("gateway failed to start");
        }
    }

    HttpResult get(const std::string& target) {
        return httpRequest("127.0.0.1", gateway.port(), "GET", target, "", std::chrono::milliseconds(3000));
    }

    HttpResult post(const std::string& target, const std::string& body) {
        return httpRequest("127.0.0.1", gateway.port(), "POST", target, body, std::chrono::milliseconds(3000));
    }

    test::TempDir dir;
    Config config;
    Queue queue;
    EventLog log;
    IdleProbe probe;
    Overview overview;
    Gateway gateway;
};

HttpRequest request(const std::string& method, const std::string& target, const std::string& body = "") {
    HttpRequest req;
    std::string head = method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n";
    if (!parseRequestHead(head, req)) {
        throw std::runtime_error("bad test request: " + head);
    }
    req.body = body;
    return req;
}

// Collects events from a push source until `done` holds or time runs out.
std::vector<Event> collect(PushSource& source, const std::function<bool(const std::vector<Event>&)>& done) {
    std::vector<Event> events;
    std::string error;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!done(events) && std::chrono::steady_clock::now() < deadline) {
        if (!source.next(events, std::chrono::milliseconds(100), error)) {
            break;
        }
    }
    return events;
}

std::string readRaw(int fd, std::chrono::milliseconds duration) {
    std::string data;
    auto deadline = std::chrono::steady_clock::now() + duration;
    char buf[4096];
    while (std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, 50) <= 0) {
            continue;
        }
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        data.append(buf, static_cast<std::size_t>(n));
    }
    return data;
}
}

TEST_CASE("Query parameters are clamped into range", "[gateway]") {
    CHECK(clampParam("", 10, 0, 100) == 10);
    CHECK(clampParam("abc", 10, 0, 100) == 10);
    CHECK(clampParam("-5", 10, 0, 100) == 10);
    CHECK(clampParam("50", 10, 0, 100) == 50);
    CHECK(clampParam("5000000", 10, 0, 100) == 100);
    CHECK(clampParam("0", 10, 1, 3600) == 1);
    CHECK(clampParam("99999999999999999999999", 10, 0, 100) == 100);
    CHECK(clampParam("0000000000000000000000007", 10, 0, 100) == 100);
}

TEST_CASE("Since accepts epoch seconds or ISO timestamps", "[gateway]") {
    auto iso = parseSince("2025-03-01T12:00:00Z");
    REQUIRE(iso);
    CHECK(iso == parseTimestamp("2025-03-01T12:00:00Z"));

    auto epoch = parseSince("1740830400");
    REQUIRE(epoch);
    CHECK(*epoch == *iso);

    auto fractional = parseSince("1740830400.5");
    REQUIRE(fractional);
    CHECK(*fractional - *iso == std::chrono::milliseconds(500));

    CHECK_FALSE(parseSince(""));
    CHECK_FALSE(parseSince("yesterday"));
    CHECK_FALSE(parseSince("1.2.3"));
    CHECK_FALSE(parseSince(".5"));
    CHECK_FALSE(parseSince("-10"));
}

TEST_CASE("Job submission over HTTP", "[gateway]") {
    GatewayFixture fx;

    SECTION("a valid job is accepted and queued") {
        auto result = fx.post("/api/jobs/submit", R"({"type":"ScanChanged","mode":"changed","repo":"heimgewebe/wgx"})");
        REQUIRE(result.ok);
        CHECK(result.status == 202);
        auto body = nlohmann::json::parse(result.body);
        CHECK(body["enqueued"] == true);
        CHECK_FALSE(body["job"].get<std::string>().empty());
        CHECK(fx.queue.size() == 1);
    }

    SECTION("invalid bodies are rejected with 400") {
        for (const char* body : {"not json", "[1,2]", R"({"type":"Deploy"})", R"({"type":"ScanAll","repo":"../x"})"}) {
            auto result = fx.post("/api/jobs/submit", body);
            REQUIRE(result.ok);
            CHECK(result.status == 400);
            CHECK(nlohmann::json::parse(result.body).contains("error"));
        }
        CHECK(fx.queue.size() == 0);
    }
}

TEST_CASE("Recent events come back oldest first", "[gateway]") {
    GatewayFixture fx;
    for (int i = 0; i < 8; ++i) {
        fx.log.append("debug", {{"i", i}});
    }

    auto result = fx.get("/api/events/recent?n=3");
    REQUIRE(result.ok);
    REQUIRE(result.status == 200);
    auto events = nlohmann::json::parse(result.body)["events"];
    REQUIRE(events.size() == 3);
    CHECK(events[0]["seq"] == 6);
    CHECK(events[2]["seq"] == 8);

    auto all = nlohmann::json::parse(fx.get("/api/events/recent?n=oops").body)["events"];
    CHECK(all.size() == 8);

    auto capped = nlohmann::json::parse(fx.get("/api/events/recent?n=99999999999999999999").body)["events"];
    CHECK(capped.size() == 8);
}

TEST_CASE("Recent events can be limited to those since a point in time", "[gateway]") {
    test::TempDir dir;
    Config config = test::testConfig(dir.path());
    // Two events an hour apart, written the way another process would
    {
        std::ofstream out(config.eventLogPath());
        out << R"({"seq":1,"ts":"2025-03-01T11:00:00.000Z","kind":"job.started","payload":{"job_id":"a"}})" << '\n'
            << R"({"seq":2,"ts":"2025-03-01T12:00:00.000Z","kind":"job.done","payload":{"job_id":"a"}})" << '\n';
    }
    Queue queue(config);
    EventLog log(config.eventLogPath());
    IdleProbe probe;
    Overview overview(queue, log, probe, config.overviewEvents);
    Gateway gateway(config, queue, log, overview);

    auto seqsFor = [&](const std::string& target) {
        auto response = gateway.handle(request("GET", target), "127.0.0.1");
        REQUIRE(response.status == 200);
        std::vector<std::uint64_t> seqs;
        auto body = nlohmann::json::parse(response.body);
        for (const auto& event : body["events"]) {
            seqs.push_back(event["seq"].get<std::uint64_t>());
        }
        return seqs;
    };

    CHECK(seqsFor("/api/events/recent") == std::vector<std::uint64_t>{1, 2});
    CHECK(seqsFor("/api/events/recent?since=2025-03-01T11:30:00Z") == std::vector<std::uint64_t>{2});
    // The bound is inclusive
    CHECK(seqsFor("/api/events/recent?since=1740830400") == std::vector<std::uint64_t>{2});
    CHECK(seqsFor("/api/events/recent?since=1740830400.001").empty());
    CHECK(seqsFor("/api/events/recent?n=1&since=0") == std::vector<std::uint64_t>{2});

    auto bad = gateway.handle(request("GET", "/api/events/recent?since=soon"), "127.0.0.1");
    CHECK(bad.status == 400);
    CHECK(nlohmann::json::parse(bad.body).contains("error"));
}

TEST_CASE("The newest log file is served as text", "[gateway]") {
    GatewayFixture fx([](Config& config) { config.rateLimit = 2; });

    SECTION("an empty log directory yields an empty body") {
        auto empty = fx.get("/logs/latest");
        REQUIRE(empty.ok);
        CHECK(empty.status == 200);
        CHECK(empty.body.empty());
    }

    SECTION("the most recently modified .log file wins") {
        auto write = [&](const std::string& name, const std::string& text) {
            std::ofstream out(fx.config.logsDir() / name);
            out << text;
        };
        write("worker-old.log", "old run\n");
        write("worker-new.log", "new run\n");
        write("notes.txt", "not a log\n");
        auto now = std::filesystem::file_time_type::clock::now();
        std::filesystem::last_write_time(fx.config.logsDir() / "worker-old.log", now - std::chrono::hours(2));
        std::filesystem::last_write_time(fx.config.logsDir() / "worker-new.log", now - std::chrono::hours(1));
        std::filesystem::last_write_time(fx.config.logsDir() / "notes.txt", now);

        auto latest = fx.get("/logs/latest");
        REQUIRE(latest.ok);
        CHECK(latest.status == 200);
        CHECK(latest.body == "new run\n");
        CHECK(fx.gateway.handle(request("POST", "/logs/latest"), "127.0.0.1").status == 405);
    }

    SECTION("log reads count against the rate limit") {
        CHECK(fx.gateway.handle(request("GET", "/logs/latest"), "10.0.0.9").status == 200);
        CHECK(fx.gateway.handle(request("GET", "/logs/latest"), "10.0.0.9").status == 200);
        CHECK(fx.gateway.handle(request("GET", "/logs/latest"), "10.0.0.9").status == 429);
    }
}

TEST_CASE("Overview and health endpoints", "[gateway]") {
    GatewayFixture fx;
    JobSpec spec;
    spec.type = "PRSweep";
    REQUIRE(fx.queue.submit(spec).ok);
    fx.log.append("worker.start");

    auto overview = fx.get("/api/overview");
    REQUIRE(overview.status == 200);
    auto body = nlohmann::json::parse(overview.body);
    CHECK(body["worker"]["activeState"] == "active");
    CHECK(body["queue"]["size"] == 1);
    CHECK(body["events"].size() == 1);

    auto health = fx.get("/healthz");
    CHECK(health.status == 200);
    CHECK(health.body == "ok");

    auto ready = fx.get("/readyz");
    CHECK(ready.status == 200);

    SECTION("an unreadable queue degrades the overview without failing the request") {
        auto ready = fx.config.queueDir() / "ready";
        std::filesystem::remove_all(ready);
        std::ofstream(ready) << "not a directory";

        auto degraded = fx.get("/api/overview");
        REQUIRE(degraded.ok);
        CHECK(degraded.status == 200);
        auto partial = nlohmann::json::parse(degraded.body);
        CHECK(partial["queue"]["size"] == 0);
        CHECK(partial["events"].size() == 1);
        CHECK(fx.get("/healthz").status == 200);
    }

    SECTION("readiness reports missing state directories") {
        std::filesystem::remove_all(fx.config.logsDir());
        auto degraded = fx.get("/readyz");
        CHECK(degraded.status == 503);
        auto missing = nlohmann::json::parse(degraded.body)["missing"];
        CHECK(missing.size() == 1);
    }
}

TEST_CASE("Routing rejects unknown paths and wrong methods", "[gateway]") {
    GatewayFixture fx;
    CHECK(fx.gateway.handle(request("GET", "/nope"), "127.0.0.1").status == 404);
    CHECK(fx.gateway.handle(request("GET", "/api/jobs/submit"), "127.0.0.1").status == 405);
    CHECK(fx.gateway.handle(request("POST", "/api/overview"), "127.0.0.1").status == 405);
    CHECK(fx.gateway.handle(request("POST", "/events/stream"), "127.0.0.1").status == 405);
    CHECK(fx.gateway.handle(request("OPTIONS", "/api/jobs/submit"), "127.0.0.1").status == 204);

    auto wire = fx.post("/healthz", "");
    REQUIRE(wire.ok);
    CHECK(wire.status == 405);
}

TEST_CASE("API requests are rate limited per client", "[gateway]") {
    GatewayFixture fx([](Config& config) { config.rateLimit = 2; });

    CHECK(fx.gateway.handle(request("GET", "/api/overview"), "10.0.0.1").status == 200);
    CHECK(fx.gateway.handle(request("GET", "/api/events/recent"), "10.0.0.1").status == 200);
    auto limited = fx.gateway.handle(request("GET", "/api/overview"), "10.0.0.1");
    CHECK(limited.status == 429);
    bool retryAfter = false;
    for (const auto& header : limited.headers) {
        retryAfter = retryAfter || header.first == "Retry-After";
    }
    CHECK(retryAfter);

    CHECK(fx.gateway.handle(request("GET", "/api/overview"), "10.0.0.2").status == 200);
    CHECK(fx.gateway.handle(request("GET", "/healthz"), "10.0.0.1").status == 200);
}

TEST_CASE("CORS headers are only sent to allowed origins", "[gateway]") {
    GatewayFixture fx;
    auto origin = [](const HttpResponse& response) {
        for (const auto& header : response.headers) {
            if (header.first == "Access-Control-Allow-Origin") return header.second;
        }
        return std::string();
    };

    auto allowed = request("GET", "/healthz");
    allowed.headers["origin"] = "http://localhost:3000";
    CHECK(origin(fx.gateway.handle(allowed, "127.0.0.1")) == "http://localhost:3000");

    auto foreign = request("GET", "/healthz");
    foreign.headers["origin"] = "http://evil.example";
    CHECK(origin(fx.gateway.handle(foreign, "127.0.0.1")).empty());
}

TEST_CASE("The stream replays recent history then follows live appends", "[gateway][stream]") {
    GatewayFixture fx;
    for (int i = 0; i < 5; ++i) {
        fx.log.append("debug", {{"i", i}});
    }

    PushSource source("127.0.0.1", fx.gateway.port(), 3, std::chrono::seconds(1));
    std::string error;
    REQUIRE(source.open(error));
    CHECK(test::waitUntil([&] { return fx.gateway.activeStreams() == 1; }));

    auto replayed = collect(source, [](const std::vector<Event>& e) { return e.size() >= 3; });
    REQUIRE(replayed.size() == 3);
    CHECK(replayed.front().seq == 3);
    CHECK(replayed.back().seq == 5);

    fx.log.append("job.started", {{"job_id", "a"}});
    fx.log.append("job.done", {{"job_id", "a"}});

    auto live = collect(source, [](const std::vector<Event>& e) { return e.size() >= 2; });
    REQUIRE(live.size() == 2);
    CHECK(live[0].seq == 6);
    CHECK(live[0].kind == "job.started");
    CHECK(live[1].seq == 7);

    source.close();
    CHECK(test::waitUntil([&] { return fx.gateway.activeStreams() == 0; }));
}

TEST_CASE("Idle streams carry heartbeats", "[gateway][stream]") {
    GatewayFixture fx;
    std::string error;
    int fd = connectTo("127.0.0.1", fx.gateway.port(), std::chrono::milliseconds(2000), error);
    REQUIRE(fd >= 0);
    REQUIRE(sendAll(fd, "GET /events/stream?replay=0&heartbeat=1 HTTP/1.1\r\nHost: x\r\n\r\n"));

    std::string data = readRaw(fd, std::chrono::milliseconds(2500));
    ::close(fd);

    CHECK(data.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(data.find("Content-Type: text/event-stream") != std::string::npos);
    CHECK(data.find("event: heartbeat\ndata: ") != std::string::npos);
    CHECK(data.find("id: ") == std::string::npos);
}

TEST_CASE("A stream that falls too far behind is told what it missed", "[gateway][stream]") {
    GatewayFixture fx([](Config& config) { config.backlogLimit = 2; });
    std::string error;
    int fd = connectTo("127.0.0.1", fx.gateway.port(), std::chrono::milliseconds(2000), error);
    REQUIRE(fd >= 0);
    REQUIRE(sendAll(fd, "GET /events/stream?replay=0 HTTP/1.1\r\nHost: x\r\n\r\n"));
    REQUIRE(test::waitUntil([&] { return fx.gateway.activeStreams() == 1; }));

    // Six events land in the gateway's log in a single write from another
    // writer, so the stream sees them as one batch on its next size check
    {
        test::TempDir scratch;
        auto staged = scratch.path() / "events.jsonl";
        {
            EventLog writer(staged);
            for (int i = 0; i < 6; ++i) {
                writer.append("debug", {{"i", i}});
            }
        }
        std::ifstream in(staged, std::ios::binary);
        std::string burst((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::ofstream out(fx.config.eventLogPath(), std::ios::binary | std::ios::app);
        out.write(burst.data(), static_cast<std::streamsize>(burst.size()));
    }

    std::string data = readRaw(fd, std::chrono::milliseconds(1000));
    ::close(fd);

    REQUIRE(data.find("event: stream.gap") != std::string::npos);
    CHECK(data.find("\"dropped\":4") != std::string::npos);
    for (const char* missed : {"id: 1\n", "id: 2\n", "id: 3\n", "id: 4\n"}) {
        CHECK(data.find(missed) == std::string::npos);
    }
    CHECK(data.find("id: 5\n") != std::string::npos);
    CHECK(data.find("id: 6\n") != std::string::npos);
}

TEST_CASE("Stream connections can be force-closed", "[gateway][stream]") {
    GatewayFixture fx;
    PushSource source("127.0.0.1", fx.gateway.port(), 0, std::chrono::seconds(1));
    std::string error;
    REQUIRE(source.open(error));
    REQUIRE(test::waitUntil([&] { return fx.gateway.activeStreams() == 1; }));

    fx.gateway.closeStreams();

    std::vector<Event> events;
    bool alive = true;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (alive && std::chrono::steady_clock::now() < deadline) {
        alive = source.next(events, std::chrono::milliseconds(100), error);
    }
    CHECK_FALSE(alive);
    CHECK_FALSE(error.empty());
    CHECK(test::waitUntil([&] { return fx.gateway.activeStreams() == 0; }));

    auto health = fx.get("/healthz");
    CHECK(health.status == 200);
}

TEST_CASE("Connections beyond the cap are refused with 503", "[gateway]") {
    GatewayFixture fx([](Config& config) { config.maxConnections = 1; });
    PushSource holder("127.0.0.1", fx.gateway.port(), 0, std::chrono::seconds(5));
    std::string error;
    REQUIRE(holder.open(error));
    REQUIRE(test::waitUntil([&] { return fx.gateway.activeConnections() == 1; }));

    auto refused = fx.get("/healthz");
    REQUIRE(refused.ok);
    CHECK(refused.status == 503);

    holder.close();
    CHECK(test::waitUntil([&] { return fx.get("/healthz").status == 200; }));
}

TEST_CASE("Stopping the gateway ends open streams", "[gateway][stream]") {
    GatewayFixture fx;
    PushSource source("127.0.0.1", fx.gateway.port(), 0, std::chrono::seconds(1));
    std::string error;
    REQUIRE(source.open(error));
    REQUIRE(test::waitUntil([&] { return fx.gateway.activeStreams() == 1; }));

    fx.gateway.stop();
    CHECK_FALSE(fx.gateway.isRunning());
    CHECK(fx.gateway.activeStreams() == 0);
    CHECK(fx.gateway.activeConnections() == 0);
}

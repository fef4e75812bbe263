/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/gateway.hpp"
#include "sichter/event_log.hpp"
#include "sichter/logger.hpp"
#include "sichter/overview.hpp"
#include "sichter/queue.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sichter {

namespace {
constexpr std::size_t kMaxBody = 64 * 1024;
constexpr std::chrono::milliseconds kSocketTimeout{10000};
constexpr std::chrono::milliseconds kAcceptPoll{200};
constexpr std::chrono::milliseconds kStreamWait{250};
constexpr std::chrono::seconds kRateWindow{60};
constexpr std::size_t kMaxRateClients = 4096;
constexpr std::streamoff kMaxLogBytes = 1024 * 1024;
}

const char* toString(StreamState state) noexcept {
    switch (state) {
        case StreamState::Connecting: return "connecting";
        case StreamState::Replaying: return "replaying";
        case StreamState::Live: return "live";
        case StreamState::Closed: return "closed";
    }
    return "unknown";
}

std::size_t clampParam(const std::string& value, std::size_t fallback,
                       std::size_t min, std::size_t max) noexcept {
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return fallback;
    }
    if (value.size() > 18) {
        return max;
    }
    std::size_t parsed = 0;
    for (char c : value) {
        parsed = parsed * 10 + static_cast<std::size_t>(c - '0');
    }
    return std::clamp(parsed, min, max);
}

std::optional<Timestamp> parseSince(const std::string& value) noexcept {
    if (value.empty()) {
        return std::nullopt;
    }
    bool numeric = std::all_of(value.begin(), value.end(),
                               [](unsigned char c) { return std::isdigit(c) || c == '.'; });
    if (!numeric) {
        return parseTimestamp(value);
    }
    if (std::count(value.begin(), value.end(), '.') > 1 || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        return std::nullopt;
    }
    char* end = nullptr;
    double seconds = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || seconds > 1e11) {
        return std::nullopt;
    }
    auto since = std::chrono::duration_cast<Timestamp::duration>(std::chrono::duration<double>(seconds));
    return Timestamp(since);
}

Gateway::Gateway(const Config& config, Queue& queue, const EventLog& log, const Overview& overview)
    : config_(config), queue_(queue), log_(log), overview_(overview) {
    LOG_DEBUG("Gateway created for " + config_.host + ":" + std::to_string(config_.port));
}

Gateway::~Gateway() {
    stop();
}

bool Gateway::start() {
    if (running_.load()) {
        LOG_WARN("Gateway already running");
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_ERROR(std::string("socket failed: ") + std::strerror(errno));
        return false;
    }
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) <= 0) {
        LOG_ERROR("Invalid listen address: " + config_.host);
        ::close(fd);
        return false;
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("bind " + config_.host + ":" + std::to_string(config_.port) + " failed: " + std::strerror(errno));
        ::close(fd);
        return false;
    }
    if (::listen(fd, 64) < 0) {
        LOG_ERROR(std::string("listen failed: ") + std::strerror(errno));
        ::close(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_.store(ntohs(bound.sin_port));
    } else {
        port_.store(config_.port);
    }

    listenFd_ = fd;
    running_.store(true);
    try {
        acceptThread_ = std::thread(&Gateway::acceptLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start accept thread: " + std::string(e.what()));
        running_.store(false);
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    LOG_INFO("Gateway listening on http://" + config_.host + ":" + std::to_string(port_.load()));
    return true;
}

void Gateway::stop() noexcept {
    if (!running_.exchange(false) && !acceptThread_.joinable()) {
        return;
    }

    LOG_INFO("Stopping gateway...");
    if (listenFd_ >= 0) {
        ::shutdown(listenFd_, SHUT_RDWR);
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        for (auto& [id, conn] : connections_) {
            if (conn.fd >= 0) {
                ::shutdown(conn.fd, SHUT_RDWR);
            }
            if (conn.thread.joinable()) {
                threads.push_back(std::move(conn.thread));
            }
        }
    }
    for (auto& t : threads) {
        t.join();
    }
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        connections_.clear();
    }

    LOG_INFO("Gateway stopped");
}

void Gateway::closeStreams() noexcept {
    std::lock_guard<std::mutex> lock(connMutex_);
    std::size_t closed = 0;
    for (auto& [id, conn] : connections_) {
        if (conn.stream && !conn.done && conn.fd >= 0) {
            ::shutdown(conn.fd, SHUT_RDWR);
            ++closed;
        }
    }
    LOG_INFO("Force-closed " + std::to_string(closed) + " stream(s)");
}

void Gateway::acceptLoop() {
    setThreadName("Accept");

    while (running_.load()) {
        reapFinished();

        pollfd pfd{listenFd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(kAcceptPoll.count()));
        if (rc <= 0 || !running_.load()) {
            continue;
        }

        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept4(listenFd_, reinterpret_cast<sockaddr*>(&caddr), &clen, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno != EINTR && errno != EAGAIN && running_.load()) {
                LOG_WARN(std::string("accept failed: ") + std::strerror(errno));
            }
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &caddr.sin_addr, ip, sizeof(ip));
        std::string client(ip);

        if (activeConnections_.load() >= static_cast<std::size_t>(std::max(config_.maxConnections, 1))) {
            LOG_WARN("Connection limit reached, rejecting " + client);
            setSocketTimeouts(cfd, std::chrono::milliseconds(1000));
            if (!sendAll(cfd, serializeResponse(HttpResponse::error(503, "too many connections")))) {
                LOG_DEBUG("Could not deliver 503 to " + client);
            }
            ::close(cfd);
            continue;
        }

        std::lock_guard<std::mutex> lock(connMutex_);
        std::uint64_t id = nextConnId_++;
        auto& conn = connections_[id];
        conn.fd = cfd;
        activeConnections_.fetch_add(1);
        try {
            conn.thread = std::thread(&Gateway::serveConnection, this, id, cfd, client);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start connection thread: " + std::string(e.what()));
            activeConnections_.fetch_sub(1);
            ::close(cfd);
            connections_.erase(id);
        }
    }

    LOG_DEBUG("Accept loop exiting");
}

void Gateway::reapFinished() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second.done) {
                if (it->second.thread.joinable()) {
                    finished.push_back(std::move(it->second.thread));
                }
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : finished) {
        t.join();
    }
}

void Gateway::serveConnection(std::uint64_t id, int fd, std::string client) {
    setThreadName("Conn-" + std::to_string(id));
    setSocketTimeouts(fd, kSocketTimeout);

    HttpRequest request;
    std::string error;
    if (readRequest(fd, request, kMaxBody, error)) {
        if (request.method == "GET" && request.path == "/events/stream") {
            serveStream(id, fd, request);
        } else {
            HttpResponse response = handle(request, client);
            LOG_DEBUG(request.method + " " + request.path + " -> " + std::to_string(response.status));
            if (!sendAll(fd, serializeResponse(response))) {
                LOG_DEBUG("Client went away before response: " + client);
            }
        }
    } else if (!error.empty()) {
        LOG_DEBUG("Bad request from " + client + ": " + error);
        int status = error == "request body too large" ? 413 : 400;
        if (!sendAll(fd, serializeResponse(HttpResponse::error(status, error)))) {
            LOG_DEBUG("Client went away before error response: " + client);
        }
    }

    {
        std::lock_guard<std::mutex> lock(connMutex_);
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            it->second.fd = -1;
            it->second.done = true;
        }
    }
    ::close(fd);
    activeConnections_.fetch_sub(1);
    clearThreadName();
}

void Gateway::serveStream(std::uint64_t id, int fd, const HttpRequest& request) {
    StreamState state = StreamState::Connecting;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            it->second.stream = true;
        }
    }
    activeStreams_.fetch_add(1);

    std::size_t replay = clampParam(request.param("replay"), config_.replay, 0, config_.recentMax);
    auto heartbeat = std::chrono::seconds(
        clampParam(request.param("heartbeat"), static_cast<std::size_t>(config_.heartbeat.count()), 1, 3600));

    std::string head =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: close\r\n"
        "X-Accel-Buffering: no\r\n";
    std::string origin = allowedOrigin(request);
    if (!origin.empty()) {
        head += "Access-Control-Allow-Origin: " + origin + "\r\nVary: Origin\r\n";
    }
    head += "\r\n";

    std::uint64_t sent = 0;
    bool open = sendAll(fd, head);
    if (open) {
        state = StreamState::Replaying;
        EventBatch snapshot = log_.tail(replay);
        for (const auto& event : snapshot.events) {
            if (!(open = sendEvent(fd, event))) break;
            ++sent;
        }

        // Live delivery resumes at the byte just past the replayed snapshot
        std::uint64_t offset = snapshot.offset;
        auto lastSend = std::chrono::steady_clock::now();
        if (open) {
            state = StreamState::Live;
            LOG_DEBUG("Stream " + std::to_string(id) + " " + toString(state) + " after replaying " +
                      std::to_string(snapshot.events.size()));
        }

        while (open && running_.load()) {
            if (log_.waitForAppend(offset, kStreamWait)) {
                EventBatch batch = log_.readFrom(offset);
                if (batch.events.empty() && batch.offset == offset) {
                    // Only a partial line so far
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                } else {
                    offset = batch.offset;
                    auto& events = batch.events;
                    if (events.size() > config_.backlogLimit) {
                        std::size_t dropped = events.size() - config_.backlogLimit;
                        LOG_WARN("Stream " + std::to_string(id) + " behind by " +
                                 std::to_string(events.size()) + " events, dropping " + std::to_string(dropped));
                        open = sendNamed(fd, "stream.gap", {
                            {"kind", "stream.gap"},
                            {"ts", formatTimestamp(std::chrono::system_clock::now())},
                            {"dropped", dropped},
                            {"from_seq", events.front().seq},
                            {"to_seq", events[dropped - 1].seq},
                        });
                        events.erase(events.begin(), events.begin() + static_cast<std::ptrdiff_t>(dropped));
                    }
                    for (const auto& event : events) {
                        if (!open) break;
                        open = sendEvent(fd, event);
                        ++sent;
                    }
                    lastSend = std::chrono::steady_clock::now();
                }
            }

            if (open && peerClosed(fd)) {
                open = false;
            }
            if (open && std::chrono::steady_clock::now() - lastSend >= heartbeat) {
                open = sendNamed(fd, "heartbeat", {
                    {"kind", "heartbeat"},
                    {"ts", formatTimestamp(std::chrono::system_clock::now())},
                });
                lastSend = std::chrono::steady_clock::now();
            }
        }
    }

    state = StreamState::Closed;
    activeStreams_.fetch_sub(1);
    LOG_DEBUG("Stream " + std::to_string(id) + " " + toString(state) + " after " + std::to_string(sent) + " event(s)");
}

bool Gateway::sendEvent(int fd, const Event& event) noexcept {
    try {
        std::string frame = "id: " + std::to_string(event.seq) + "\ndata: " +
                            toJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
        return sendAll(fd, frame);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to encode event " + std::to_string(event.seq) + ": " + e.what());
        return false;
    }
}

bool Gateway::sendNamed(int fd, const std::string& name, const nlohmann::json& data) noexcept {
    try {
        return sendAll(fd, "event: " + name + "\ndata: " + data.dump() + "\n\n");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to encode " + name + ": " + e.what());
        return false;
    }
}

bool Gateway::peerClosed(int fd) noexcept {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, 0) <= 0) {
        return false;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        return true;
    }
    char byte = 0;
    ssize_t n = ::recv(fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n == 0) {
        return true;
    }
    if (n < 0) {
        return errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
    }
    // Clients have nothing to say on a stream; discard
    char sink[256];
    while (::recv(fd, sink, sizeof(sink), MSG_DONTWAIT) > 0) {
    }
    return false;
}

HttpResponse Gateway::handle(const HttpRequest& request, const std::string& client) {
    HttpResponse response;
    try {
        response = route(request, client);
    } catch (const std::exception& e) {
        LOG_ERROR(request.method + " " + request.path + " failed: " + e.what());
        response = HttpResponse::error(500, "internal error");
    }

    std::string origin = allowedOrigin(request);
    if (!origin.empty()) {
        response.headers.emplace_back("Access-Control-Allow-Origin", origin);
        response.headers.emplace_back("Vary", "Origin");
    }
    return response;
}

HttpResponse Gateway::route(const HttpRequest& request, const std::string& client) {
    const std::string& path = request.path;
    const bool limited = path.rfind("/api/", 0) == 0 || path.rfind("/logs/", 0) == 0;

    HttpResponse response;
    if (request.method == "OPTIONS") {
        response.status = 204;
        response.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        response.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type");
        response.headers.emplace_back("Access-Control-Max-Age", "600");
    } else if (limited && !allowRequest(client)) {
        LOG_WARN("Rate limit exceeded for " + client);
        response = HttpResponse::error(429, "rate limit exceeded");
        response.headers.emplace_back("Retry-After", std::to_string(kRateWindow.count()));
    } else if (path == "/healthz") {
        response = request.method == "GET" ? HttpResponse::text(200, "ok")
                                           : HttpResponse::error(405, "method not allowed");
    } else if (path == "/readyz") {
        response = request.method == "GET" ? readiness() : HttpResponse::error(405, "method not allowed");
    } else if (path == "/api/jobs/submit") {
        response = request.method == "POST" ? submit(request) : HttpResponse::error(405, "method not allowed");
    } else if (path == "/api/events/recent") {
        response = request.method == "GET" ? recent(request) : HttpResponse::error(405, "method not allowed");
    } else if (path == "/api/overview") {
        response = request.method == "GET" ? overview() : HttpResponse::error(405, "method not allowed");
    } else if (path == "/logs/latest") {
        response = request.method == "GET" ? latestLog() : HttpResponse::error(405, "method not allowed");
    } else if (path == "/events/stream") {
        response = HttpResponse::error(405, "method not allowed");
    } else {
        response = HttpResponse::error(404, "not found");
    }
    return response;
}

HttpResponse Gateway::submit(const HttpRequest& request) {
    auto body = nlohmann::json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return HttpResponse::error(400, "body must be a JSON object");
    }

    JobSpec spec;
    std::string error;
    if (!jobSpecFromJson(body, spec, error)) {
        return HttpResponse::error(400, error);
    }

    SubmitResult result = queue_.submit(spec);
    if (result) {
        LOG_INFO("Accepted job " + result.id + " (" + spec.type + ")");
        return HttpResponse::json(202, {{"enqueued", true}, {"job", result.id}});
    }

    if (result.error == ErrorKind::Validation) {
        return HttpResponse::error(400, result.message);
    }
    LOG_ERROR("Submission failed: " + result.message);
    return HttpResponse::error(500, result.message);
}

HttpResponse Gateway::recent(const HttpRequest& request) const {
    std::size_t n = clampParam(request.param("n"), config_.recentDefault, 0, config_.recentMax);

    std::optional<Timestamp> since;
    std::string sinceParam = request.param("since");
    if (!sinceParam.empty()) {
        since = parseSince(sinceParam);
        if (!since) {
            return HttpResponse::error(400, "since must be epoch seconds or an ISO-8601 UTC timestamp");
        }
    }

    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : log_.tail(n).events) {
        if (since && event.ts < *since) {
            continue;
        }
        events.push_back(toJson(event));
    }
    return HttpResponse::json(200, {{"events", events}});
}

// Newest *.log by modification time. Files over kMaxLogBytes are served from their tail.
HttpResponse Gateway::latestLog() const {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::directory_iterator it(config_.logsDir(), ec);
    if (ec) {
        return HttpResponse::text(200, "");
    }

    fs::path newest;
    fs::file_time_type newestTime;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::path& path = it->path();
        std::error_code fileEc;
        if (path.extension() != ".log" || !it->is_regular_file(fileEc)) {
            continue;
        }
        auto mtime = fs::last_write_time(path, fileEc);
        if (fileEc) {
            continue;
        }
        if (newest.empty() || mtime > newestTime) {
            newest = path;
            newestTime = mtime;
        }
    }
    if (newest.empty()) {
        return HttpResponse::text(200, "");
    }

    std::ifstream in(newest, std::ios::binary);
    if (!in) {
        return HttpResponse::error(500, "failed to read log: " + newest.filename().string());
    }
    in.seekg(0, std::ios::end);
    std::streamoff length = in.tellg();
    std::streamoff offset = length > kMaxLogBytes ? length - kMaxLogBytes : 0;
    in.seekg(offset, std::ios::beg);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return HttpResponse::error(500, "failed to read log: " + newest.filename().string());
    }
    return HttpResponse::text(200, content);
}

HttpResponse Gateway::overview() const {
    return HttpResponse::json(200, toJson(overview_.snapshot()));
}

HttpResponse Gateway::readiness() const {
    nlohmann::json missing = nlohmann::json::array();
    for (const auto& dir : {config_.queueDir() / "ready", config_.eventsDir(), config_.logsDir()}) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            missing.push_back(dir.string());
        }
    }
    if (missing.empty() && queue_.isAvailable()) {
        return HttpResponse::json(200, {{"ready", true}});
    }
    return HttpResponse::json(503, {{"ready", false}, {"missing", missing}});
}

bool Gateway::allowRequest(const std::string& client) {
    if (config_.rateLimit <= 0) {
        return true;
    }

    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(rateMutex_);
    if (rateWindows_.size() > kMaxRateClients) {
        for (auto it = rateWindows_.begin(); it != rateWindows_.end();) {
            it = now - it->second.start >= kRateWindow ? rateWindows_.erase(it) : std::next(it);
        }
    }

    auto& window = rateWindows_[client];
    if (window.count == 0 || now - window.start >= kRateWindow) {
        window.start = now;
        window.count = 0;
    }
    return ++window.count <= config_.rateLimit;
}

std::string Gateway::allowedOrigin(const HttpRequest& request) const {
    std::string origin = request.header("origin");
    if (origin.empty()) {
        return "";
    }
    for (const auto& allowed : config_.allowedOrigins) {
        if (allowed == "*" || allowed == origin) {
            return origin;
        }
    }
    return "";
}

}

/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "sichter/config.hpp"
#include "sichter/http.hpp"
#include "sichter/types.hpp"

namespace sichter {

class Queue;
class EventLog;
class Overview;
struct Event;

enum class StreamState : std::uint8_t { Connecting, Replaying, Live, Closed };

[[nodiscard]] const char* toString(StreamState state) noexcept;

// HTTP front end: job submission, snapshots, and a Server-Sent Events feed
// of the event log. The gateway only reads the log; it never blocks the worker.
class Gateway final {
public:
    Gateway(const Config& config, Queue& queue, const EventLog& log, const Overview& overview);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;
    Gateway(Gateway&&) = delete;
    Gateway& operator=(Gateway&&) = delete;

    // Binds and starts accepting. Port 0 picks an ephemeral port, see port().
    [[nodiscard]] bool start();
    // Closes the listener and every connection, then joins their threads.
    void stop() noexcept;
    // Force-closes live stream connections only.
    void closeStreams() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_.load(); }
    [[nodiscard]] std::size_t activeConnections() const noexcept { return activeConnections_.load(); }
    [[nodiscard]] std::size_t activeStreams() const noexcept { return activeStreams_.load(); }

    // Routes every endpoint except the event stream. A failing handler
    // becomes a 500 response.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request, const std::string& client);

private:
    struct Connection {
        int fd = -1;
        bool stream = false;
        bool done = false;
        std::thread thread;
    };

    struct RateWindow {
        std::chrono::steady_clock::time_point start;
        int count = 0;
    };

    void acceptLoop();
    void serveConnection(std::uint64_t id, int fd, std::string client);
    void serveStream(std::uint64_t id, int fd, const HttpRequest& request);
    [[nodiscard]] bool sendEvent(int fd, const Event& event) noexcept;
    [[nodiscard]] bool sendNamed(int fd, const std::string& name, const nlohmann::json& data) noexcept;
    [[nodiscard]] static bool peerClosed(int fd) noexcept;
    void reapFinished();

    [[nodiscard]] HttpResponse route(const HttpRequest& request, const std::string& client);
    [[nodiscard]] HttpResponse submit(const HttpRequest& request);
    [[nodiscard]] HttpResponse recent(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse overview() const;
    [[nodiscard]] HttpResponse readiness() const;
    [[nodiscard]] HttpResponse latestLog() const;

    [[nodiscard]] bool allowRequest(const std::string& client);
    [[nodiscard]] std::string allowedOrigin(const HttpRequest& request) const;

    Config config_;
    Queue& queue_;
    const EventLog& log_;
    const Overview& overview_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
    int listenFd_ = -1;
    std::thread acceptThread_;

    std::mutex connMutex_;
    std::map<std::uint64_t, Connection> connections_;
    std::uint64_t nextConnId_ = 1;
    std::atomic<std::size_t> activeConnections_{0};
    std::atomic<std::size_t> activeStreams_{0};

    std::mutex rateMutex_;
    std::unordered_map<std::string, RateWindow> rateWindows_;
};

// Reads a non-negative integer query value, clamped to [min, max].
[[nodiscard]] std::size_t clampParam(const std::string& value, std::size_t fallback,
                                     std::size_t min, std::size_t max) noexcept;

// Accepts epoch seconds (fractions allowed) or an ISO-8601 UTC timestamp.
[[nodiscard]] std::optional<Timestamp> parseSince(const std::string& value) noexcept;

}

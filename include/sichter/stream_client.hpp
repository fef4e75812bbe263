/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "sichter/config.hpp"
#include "sichter/event.hpp"

namespace sichter {

struct StreamView {
    bool connected = false;      // push channel is open
    std::vector<Event> events;   // oldest first, unique by seq
    std::string error;           // last transport error, empty when healthy
};

// One way of getting events from the gateway.
class EventSource {
public:
    virtual ~EventSource() = default;

    [[nodiscard]] virtual bool open(std::string& error) = 0;
    // Appends whatever arrived within `timeout`. False means the source
    // failed or was closed by the peer; `error` says why.
    [[nodiscard]] virtual bool next(std::vector<Event>& out, std::chrono::milliseconds timeout,
                                    std::string& error) = 0;
    virtual void close() noexcept = 0;
    [[nodiscard]] virtual bool isPush() const noexcept = 0;
};

// Server-Sent Events from /events/stream.
class PushSource final : public EventSource {
public:
    PushSource(std::string host, std::uint16_t port, std::size_t replay, std::chrono::seconds heartbeat);
    ~PushSource() override;

    PushSource(const PushSource&) = delete;
    PushSource& operator=(const PushSource&) = delete;

    [[nodiscard]] bool open(std::string& error) override;
    [[nodiscard]] bool next(std::vector<Event>& out, std::chrono::milliseconds timeout,
                            std::string& error) override;
    void close() noexcept override;
    [[nodiscard]] bool isPush() const noexcept override { return true; }

    // Consumes complete frames from `buffer`; heartbeats and gap notices are
    // dropped but still count as activity.
    static void parseFrames(std::string& buffer, std::vector<Event>& out);

private:
    std::string host_;
    std::uint16_t port_;
    std::size_t replay_;
    std::chrono::seconds heartbeat_;
    int fd_ = -1;
    std::string buffer_;
    std::chrono::steady_clock::time_point lastActivity_;
};

// Snapshot reads of /api/events/recent.
class PollSource final : public EventSource {
public:
    PollSource(std::string host, std::uint16_t port, std::size_t count);

    [[nodiscard]] bool open(std::string& error) override;
    [[nodiscard]] bool next(std::vector<Event>& out, std::chrono::milliseconds timeout,
                            std::string& error) override;
    void close() noexcept override {}
    [[nodiscard]] bool isPush() const noexcept override { return false; }

private:
    std::string host_;
    std::uint16_t port_;
    std::size_t count_;
};

// Keeps a bounded, de-duplicated view of the event log for a client,
// preferring the push channel and falling back to polling.
class StreamClient final {
public:
    using OnChange = std::function<void(const StreamView&)>;
    using SourceFactory = std::function<std::unique_ptr<EventSource>()>;

    explicit StreamClient(const Config& config, OnChange onChange = nullptr);
    StreamClient(const Config& config, OnChange onChange, SourceFactory push, SourceFactory poll);
    ~StreamClient();

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;
    StreamClient(StreamClient&&) = delete;
    StreamClient& operator=(StreamClient&&) = delete;

    [[nodiscard]] bool start();
    // Closes the push connection and stops polling.
    void stop() noexcept;

    [[nodiscard]] StreamView observe() const;
    [[nodiscard]] bool connected() const;

private:
    void run();
    void setConnected(bool connected, const std::string& error);
    void merge(const std::vector<Event>& batch);
    void notify();
    void waitFor(std::chrono::milliseconds duration);

    Config config_;
    OnChange onChange_;
    SourceFactory pushFactory_;
    SourceFactory pollFactory_;

    mutable std::mutex mutex_;
    StreamView view_;

    std::mutex wakeMutex_;
    std::condition_variable wake_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

}

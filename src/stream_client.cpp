/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/stream_client.hpp"
#include "sichter/http.hpp"
#include "sichter/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sichter {

namespace {
constexpr std::chrono::milliseconds kConnectTimeout{5000};
constexpr std::chrono::milliseconds kRequestTimeout{5000};
constexpr std::chrono::milliseconds kPushSlice{200};
}

PushSource::PushSource(std::string host, std::uint16_t port, std::size_t replay, std::chrono::seconds heartbeat)
    : host_(std::move(host)), port_(port), replay_(replay), heartbeat_(heartbeat) {
}

PushSource::~PushSource() {
    close();
}

bool PushSource::open(std::string& error) {
    close();

    fd_ = connectTo(host_, port_, kConnectTimeout, error);
    if (fd_ < 0) {
        return false;
    }

    std::ostringstream req;
    req << "GET /events/stream?replay=" << replay_ << "&heartbeat=" << heartbeat_.count() << " HTTP/1.1\r\n"
        << "Host: " << host_ << ":" << port_ << "\r\n"
        << "Accept: text/event-stream\r\n"
        << "Cache-Control: no-cache\r\n\r\n";
    if (!sendAll(fd_, req.str())) {
        error = std::string("send failed: ") + std::strerror(errno);
        close();
        return false;
    }

    HttpResult head;
    std::string rest;
    if (!readResponseHead(fd_, head, rest)) {
        error = head.error;
        close();
        return false;
    }
    if (head.status != 200) {
        error = "stream rejected: HTTP " + std::to_string(head.status);
        close();
        return false;
    }
    if (head.headers["content-type"].find("text/event-stream") == std::string::npos) {
        error = "stream has wrong content type: " + head.headers["content-type"];
        close();
        return false;
    }

    buffer_ = std::move(rest);
    lastActivity_ = std::chrono::steady_clock::now();
    LOG_DEBUG("Push channel connected to " + host_ + ":" + std::to_string(port_));
    return true;
}

bool PushSource::next(std::vector<Event>& out, std::chrono::milliseconds timeout, std::string& error) {
    if (fd_ < 0) {
        error = "stream not open";
        return false;
    }

    parseFrames(buffer_, out);

    pollfd pfd{fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0 && errno != EINTR) {
        error = std::string("poll failed: ") + std::strerror(errno);
        return false;
    }

    if (rc > 0) {
        std::array<char, 8192> chunk;
        ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), MSG_DONTWAIT);
        if (n == 0) {
            error = "stream closed by server";
            return false;
        }
        if (n < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                error = std::string("receive failed: ") + std::strerror(errno);
                return false;
            }
        } else {
            buffer_.append(chunk.data(), static_cast<std::size_t>(n));
            lastActivity_ = std::chrono::steady_clock::now();
            parseFrames(buffer_, out);
        }
    }

    // Heartbeats keep a healthy stream busy; silence means a dead peer
    if (std::chrono::steady_clock::now() - lastActivity_ > heartbeat_ * 3) {
        error = "no data for " + std::to_string(heartbeat_.count() * 3) + "s";
        return false;
    }
    return true;
}

void PushSource::close() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
    buffer_.clear();
}

void PushSource::parseFrames(std::string& buffer, std::vector<Event>& out) {
    buffer.erase(std::remove(buffer.begin(), buffer.end(), '\r'), buffer.end());

    std::string::size_type end;
    while ((end = buffer.find("\n\n")) != std::string::npos) {
        std::string frame = buffer.substr(0, end);
        buffer.erase(0, end + 2);

        std::string name;
        std::string data;
        std::istringstream lines(frame);
        std::string line;
        while (std::getline(lines, line)) {
            if (line.empty() || line[0] == ':') {
                continue;
            }
            auto colon = line.find(':');
            std::string field = line.substr(0, colon);
            std::string value = colon == std::string::npos ? "" : line.substr(colon + 1);
            if (!value.empty() && value[0] == ' ') {
                value.erase(0, 1);
            }
            if (field == "event") {
                name = value;
            } else if (field == "data") {
                if (!data.empty()) data += '\n';
                data += value;
            }
        }

        if (name == "heartbeat" || data.empty()) {
            continue;
        }
        if (name == "stream.gap") {
            auto gap = nlohmann::json::parse(data, nullptr, false);
            if (!gap.is_discarded() && gap.contains("dropped")) {
                LOG_WARN("Stream skipped " + gap["dropped"].dump() + " events");
            }
            continue;
        }

        auto event = parseEventLine(data);
        if (!event) {
            LOG_DEBUG("Ignoring malformed stream frame");
            continue;
        }
        if (event->kind != "heartbeat") {
            out.push_back(std::move(*event));
        }
    }
}

PollSource::PollSource(std::string host, std::uint16_t port, std::size_t count)
    : host_(std::move(host)), port_(port), count_(count) {
}

bool PollSource::open(std::string& error) {
    error.clear();
    return true;
}

bool PollSource::next(std::vector<Event>& out, std::chrono::milliseconds timeout, std::string& error) {
    HttpResult result = httpRequest(host_, port_, "GET", "/api/events/recent?n=" + std::to_string(count_), "",
                                    timeout);
    if (!result.ok) {
        error = result.error;
        return false;
    }
    if (result.status != 200) {
        error = "poll failed: HTTP " + std::to_string(result.status);
        return false;
    }

    auto body = nlohmann::json::parse(result.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("events") || !body["events"].is_array()) {
        error = "poll returned malformed body";
        return false;
    }
    for (const auto& item : body["events"]) {
        if (auto event = eventFromJson(item)) {
            out.push_back(std::move(*event));
        }
    }
    return true;
}

StreamClient::StreamClient(const Config& config, OnChange onChange)
    : StreamClient(config, std::move(onChange),
                   [config] {
                       return std::make_unique<PushSource>(config.host, config.port, config.replay, config.heartbeat);
                   },
                   [config] {
                       return std::make_unique<PollSource>(config.host, config.port, config.bufferLimit);
                   }) {
}

StreamClient::StreamClient(const Config& config, OnChange onChange, SourceFactory push, SourceFactory poll)
    : config_(config), onChange_(std::move(onChange)),
      pushFactory_(std::move(push)), pollFactory_(std::move(poll)) {
}

StreamClient::~StreamClient() {
    stop();
}

bool StreamClient::start() {
    if (thread_.joinable()) {
        LOG_WARN("Stream client already running");
        return false;
    }
    stop_.store(false);
    try {
        thread_ = std::thread(&StreamClient::run, this);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start stream client: " + std::string(e.what()));
        return false;
    }
}

void StreamClient::stop() noexcept {
    stop_.store(true);
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

StreamView StreamClient::observe() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return view_;
}

bool StreamClient::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return view_.connected;
}

void StreamClient::run() {
    setThreadName("Stream");
    using Clock = std::chrono::steady_clock;

    std::unique_ptr<EventSource> poller = pollFactory_();
    std::unique_ptr<EventSource> push;
    std::string pollError;
    if (!poller->open(pollError)) {
        LOG_WARN("Poll source unavailable: " + pollError);
    }

    auto nextPush = Clock::now();
    auto nextPoll = Clock::time_point::max();

    while (!stop_.load()) {
        if (!push && Clock::now() >= nextPush) {
            auto candidate = pushFactory_();
            std::string error;
            if (candidate->open(error)) {
                push = std::move(candidate);
                nextPoll = Clock::time_point::max();
                LOG_INFO("Push channel open, polling stopped");
                setConnected(true, "");
            } else {
                LOG_DEBUG("Push channel unavailable: " + error);
                nextPush = Clock::now() + config_.pushRetryInterval;
                if (nextPoll == Clock::time_point::max()) {
                    nextPoll = Clock::now();
                }
                setConnected(false, error);
            }
        }

        if (push) {
            std::vector<Event> batch;
            std::string error;
            bool alive = push->next(batch, kPushSlice, error);
            merge(batch);
            if (!alive) {
                push->close();
                push.reset();
                LOG_WARN("Push channel lost (" + error + "), falling back to polling");
                nextPush = Clock::now() + config_.pushRetryInterval;
                nextPoll = Clock::now();
                setConnected(false, error.empty() ? "stream closed" : error);
            }
            continue;
        }

        if (Clock::now() >= nextPoll) {
            std::vector<Event> batch;
            std::string error;
            if (poller->next(batch, kRequestTimeout, error)) {
                merge(batch);
            } else {
                LOG_DEBUG("Poll failed: " + error);
                setConnected(false, error);
            }
            nextPoll = Clock::now() + config_.pollInterval;
        }

        auto wake = std::min(nextPoll, nextPush);
        auto now = Clock::now();
        if (wake > now) {
            waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(wake - now) + std::chrono::milliseconds(1));
        }
    }

    if (push) {
        push->close();
    }
    poller->close();
    LOG_DEBUG("Stream client stopped");
}

void StreamClient::setConnected(bool connected, const std::string& error) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (view_.connected != connected || view_.error != error) {
            view_.connected = connected;
            view_.error = error;
            changed = true;
        }
    }
    if (changed) {
        notify();
    }
}

void StreamClient::merge(const std::vector<Event>& batch) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& events = view_.events;
        for (const auto& event : batch) {
            if (event.seq == 0 || event.kind == "heartbeat") {
                continue;
            }
            if (events.size() >= config_.bufferLimit && !events.empty() && event.seq <= events.front().seq) {
                continue;
            }
            auto pos = std::lower_bound(events.begin(), events.end(), event.seq,
                                        [](const Event& e, std::uint64_t seq) { return e.seq < seq; });
            if (pos != events.end() && pos->seq == event.seq) {
                continue;
            }
            events.insert(pos, event);
            changed = true;
        }
        if (events.size() > config_.bufferLimit) {
            events.erase(events.begin(),
                         events.begin() + static_cast<std::ptrdiff_t>(events.size() - config_.bufferLimit));
        }
    }
    if (changed) {
        notify();
    }
}

void StreamClient::notify() {
    if (!onChange_) {
        return;
    }
    StreamView snapshot = observe();
    try {
        onChange_(snapshot);
    } catch (const std::exception& e) {
        LOG_WARN("Stream change callback threw: " + std::string(e.what()));
    }
}

void StreamClient::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    wake_.wait_for(lock, duration, [this] { return stop_.load(); });
}

}

/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/event_log.hpp"
#include "sichter/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <fcntl.h>
#include <unistd.h>

namespace sichter {

namespace {
constexpr std::uint64_t kTailChunk = 64 * 1024;

void writeAll(int fd, const std::string& data, const std::filesystem::path& path) {
    const char* p = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError("Cannot append to " + path.string() + ": " + std::strerror(errno));
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
    }
}
}

EventLog::EventLog(const std::filesystem::path& path, bool fsync)
    : path_(path), fsync_(fsync) {
    LOG_DEBUG("EventLog created for: " + path_.string());
}

EventLog::~EventLog() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Event EventLog::append(Event event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        openForAppend();
    }

    event.seq = lastSeq_ + 1;
    if (event.ts == Timestamp{}) {
        event.ts = std::chrono::system_clock::now();
    }

    // Collaborator output is arbitrary bytes; never fail the append on bad UTF-8
    std::string line = toJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line += '\n';

    writeAll(fd_, line, path_);
    if (fsync_ && ::fsync(fd_) != 0) {
        throw StorageError("fsync failed for " + path_.string() + ": " + std::strerror(errno));
    }

    lastSeq_ = event.seq;
    written_ += line.size();
    appended_.notify_all();

    LOG_TRACE("Event " + std::to_string(event.seq) + " " + event.kind);
    return event;
}

Event EventLog::append(const std::string& kind, nlohmann::json payload, std::optional<std::string> line) {
    Event event;
    event.kind = kind;
    event.payload = std::move(payload);
    event.line = std::move(line);
    return append(std::move(event));
}

EventBatch EventLog::tail(std::size_t n) const {
    EventBatch batch;

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return batch;
    }
    in.seekg(0, std::ios::end);
    std::streamoff end = in.tellg();
    if (end <= 0) {
        return batch;
    }

    // Read backwards until n complete lines (plus a possibly partial first one) are buffered
    std::uint64_t start = static_cast<std::uint64_t>(end);
    std::string data;
    while (start > 0 && static_cast<std::size_t>(std::count(data.begin(), data.end(), '\n')) < n + 1) {
        std::uint64_t len = std::min(kTailChunk, start);
        start -= len;
        std::string chunk(static_cast<std::size_t>(len), '\0');
        in.seekg(static_cast<std::streamoff>(start));
        in.read(&chunk[0], static_cast<std::streamsize>(len));
        if (!in) {
            LOG_WARN("Short read on event log: " + path_.string());
            return batch;
        }
        data = chunk + data;
    }

    auto lastNl = data.rfind('\n');
    if (lastNl == std::string::npos) {
        batch.offset = start;
        return batch;
    }
    batch.offset = start + lastNl + 1;

    std::string body = data.substr(0, lastNl + 1);
    if (start > 0) {
        body.erase(0, body.find('\n') + 1);
    }

    batch.events = parseLines(body);
    if (batch.events.size() > n) {
        batch.events.erase(batch.events.begin(), batch.events.end() - static_cast<std::ptrdiff_t>(n));
    }
    return batch;
}

EventBatch EventLog::readFrom(std::uint64_t offset) const {
    EventBatch batch;
    batch.offset = offset;

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return batch;
    }
    in.seekg(0, std::ios::end);
    std::streamoff tell = in.tellg();
    auto end = static_cast<std::uint64_t>(std::max<std::streamoff>(tell, 0));
    if (end < offset) {
        LOG_WARN("Event log shrank below reader offset, restarting from the beginning");
        offset = 0;
    }

    in.seekg(static_cast<std::streamoff>(offset));
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto lastNl = data.rfind('\n');
    if (lastNl == std::string::npos) {
        batch.offset = offset;
        return batch;
    }

    batch.events = parseLines(data.substr(0, lastNl + 1));
    batch.offset = offset + lastNl + 1;
    return batch;
}

bool EventLog::waitForAppend(std::uint64_t offset, std::chrono::milliseconds timeout) const {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (appended_.wait_for(lock, timeout, [&] { return written_ > offset; })) {
            return true;
        }
    }
    // Writer may live in another process
    return size() > offset;
}

std::uint64_t EventLog::size() const noexcept {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path_, ec);
    return ec ? 0 : static_cast<std::uint64_t>(bytes);
}

bool EventLog::isAvailable() const noexcept {
    std::error_code ec;
    return std::filesystem::is_directory(path_.parent_path(), ec);
}

void EventLog::openForAppend() {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
        throw StorageError("Cannot create " + path_.parent_path().string() + ": " + ec.message());
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw StorageError("Cannot open event log " + path_.string() + ": " + std::strerror(errno));
    }

    std::uint64_t bytes = size();
    if (bytes > 0) {
        // A crash can leave a torn last line; terminate it so the next record parses
        std::ifstream in(path_, std::ios::binary);
        in.seekg(static_cast<std::streamoff>(bytes - 1));
        char last = '\n';
        in.get(last);
        if (last != '\n') {
            LOG_WARN("Event log ends with a partial record, sealing it");
            writeAll(fd_, "\n", path_);
            bytes += 1;
        }
    }

    auto previous = tail(1);
    lastSeq_ = previous.events.empty() ? 0 : previous.events.back().seq;
    written_ = bytes;

    LOG_DEBUG("Event log opened at seq " + std::to_string(lastSeq_) + ": " + path_.string());
}

std::vector<Event> EventLog::parseLines(const std::string& data) {
    std::vector<Event> events;
    std::string::size_type pos = 0;
    while (pos < data.size()) {
        auto nl = data.find('\n', pos);
        if (nl == std::string::npos) {
            break;
        }
        if (nl > pos) {
            if (auto event = parseEventLine(data.substr(pos, nl - pos))) {
                events.push_back(std::move(*event));
            } else {
                LOG_DEBUG("Skipping malformed event line");
            }
        }
        pos = nl + 1;
    }
    return events;
}

}

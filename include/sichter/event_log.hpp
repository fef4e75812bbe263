/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sichter/event.hpp"

namespace sichter {

// A run of consecutive events plus the byte offset just past the last one.
// Passing `offset` to readFrom() resumes exactly after this batch.
struct EventBatch {
    std::vector<Event> events;
    std::uint64_t offset = 0;
};

// Append-only JSON Lines file. One writer (the worker) appends; any number of
// readers, in this process or another, read complete lines only.
class EventLog final {
public:
    explicit EventLog(const std::filesystem::path& path, bool fsync = false);
    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;
    EventLog(EventLog&&) = delete;
    EventLog& operator=(EventLog&&) = delete;

    // Assigns seq (and ts when unset), writes the line and wakes followers.
    // Throws StorageError when the line cannot be written.
    Event append(Event event);
    Event append(const std::string& kind, nlohmann::json payload = nullptr,
                 std::optional<std::string> line = std::nullopt);

    // At most n most recent events, oldest first.
    [[nodiscard]] EventBatch tail(std::size_t n) const;
    // Every complete event after `offset`.
    [[nodiscard]] EventBatch readFrom(std::uint64_t offset) const;
    // True once the log extends past `offset`; false on timeout.
    [[nodiscard]] bool waitForAppend(std::uint64_t offset, std::chrono::milliseconds timeout) const;

    [[nodiscard]] std::uint64_t size() const noexcept;
    [[nodiscard]] bool isAvailable() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    bool fsync_;

    mutable std::mutex mutex_;
    mutable std::condition_variable appended_;
    int fd_ = -1;
    std::uint64_t lastSeq_ = 0;
    std::uint64_t written_ = 0;

    void openForAppend();
    [[nodiscard]] static std::vector<Event> parseLines(const std::string& data);
};

}

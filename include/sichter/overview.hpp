/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sichter/event.hpp"
#include "sichter/types.hpp"

namespace sichter {

class Queue;
class EventLog;

// Service manager view of the worker. Every field is optional except the
// two states, which fall back to "unknown".
struct WorkerStatus {
    std::string activeState = "unknown";
    std::string subState = "unknown";
    std::optional<long> mainPid;
    std::optional<std::string> since;
    std::optional<std::string> lastExit;
};

struct QueueSnapshot {
    std::size_t size = 0;
    std::vector<Job> items;
};

struct OverviewSnapshot {
    WorkerStatus worker;
    QueueSnapshot queue;
    std::vector<Event> events;
};

class WorkerProbe {
public:
    virtual ~WorkerProbe() = default;
    // Never throws; unavailable status comes back as an "unknown" WorkerStatus.
    [[nodiscard]] virtual WorkerStatus status() noexcept = 0;
};

// Asks systemd (user instance) about the worker unit.
class SystemdProbe final : public WorkerProbe {
public:
    explicit SystemdProbe(std::string unit);
    [[nodiscard]] WorkerStatus status() noexcept override;

    // Parses `systemctl show -p ...` KEY=VALUE output.
    [[nodiscard]] static WorkerStatus parse(const std::string& output);

private:
    std::string unit_;
};

// Read-only composite of worker status, pending jobs and recent events.
class Overview final {
public:
    Overview(const Queue& queue, const EventLog& log, WorkerProbe& probe, std::size_t eventCount);

    Overview(const Overview&) = delete;
    Overview& operator=(const Overview&) = delete;

    // Each part degrades on its own: a failing probe, unreadable queue or
    // unreadable log leaves the other parts intact.
    [[nodiscard]] OverviewSnapshot snapshot() const;

private:
    const Queue& queue_;
    const EventLog& log_;
    WorkerProbe& probe_;
    std::size_t eventCount_;
};

[[nodiscard]] nlohmann::json toJson(const WorkerStatus& status);
[[nodiscard]] nlohmann::json toJson(const OverviewSnapshot& snapshot);

}

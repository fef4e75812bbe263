/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/overview.hpp"
#include "sichter/collaborators.hpp"
#include "sichter/event_log.hpp"
#include "sichter/logger.hpp"
#include "sichter/queue.hpp"
#include <sstream>

namespace sichter {

namespace {
std::optional<std::string> nonEmpty(const std::string& value) {
    if (value.empty() || value == "n/a") {
        return std::nullopt;
    }
    return value;
}

nlohmann::json optionalJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
}

SystemdProbe::SystemdProbe(std::string unit) : unit_(std::move(unit)) {
}

WorkerStatus SystemdProbe::status() noexcept {
    try {
        auto result = runCommand("systemctl --user show " + shellQuote(unit_) +
                                 " -p ActiveState,SubState,MainPID,ActiveEnterTimestamp,ExecMainExitTimestamp",
                                 16 * 1024);
        if (!result.success) {
            LOG_DEBUG("systemctl unavailable for " + unit_ + ": " + result.error);
            return WorkerStatus{};
        }
        return parse(result.output);
    } catch (const std::exception& e) {
        LOG_WARN("Worker status probe failed: " + std::string(e.what()));
        return WorkerStatus{};
    }
}

WorkerStatus SystemdProbe::parse(const std::string& output) {
    WorkerStatus status;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key == "ActiveState") {
            if (!value.empty()) status.activeState = value;
        } else if (key == "SubState") {
            if (!value.empty()) status.subState = value;
        } else if (key == "MainPID") {
            try {
                long pid = std::stol(value);
                if (pid > 0) status.mainPid = pid;
            } catch (const std::exception&) {
                LOG_DEBUG("Ignoring MainPID value: " + value);
            }
        } else if (key == "ActiveEnterTimestamp") {
            status.since = nonEmpty(value);
        } else if (key == "ExecMainExitTimestamp") {
            status.lastExit = nonEmpty(value);
        }
    }
    return status;
}

Overview::Overview(const Queue& queue, const EventLog& log, WorkerProbe& probe, std::size_t eventCount)
    : queue_(queue), log_(log), probe_(probe), eventCount_(eventCount) {
}

OverviewSnapshot Overview::snapshot() const {
    OverviewSnapshot snap;
    snap.worker = probe_.status();

    try {
        snap.queue.items = queue_.peekAll();
        snap.queue.size = snap.queue.items.size();
    } catch (const std::exception& e) {
        LOG_WARN("Overview: queue unreadable: " + std::string(e.what()));
    }

    try {
        snap.events = log_.tail(eventCount_).events;
    } catch (const std::exception& e) {
        LOG_WARN("Overview: event log unreadable: " + std::string(e.what()));
    }

    return snap;
}

nlohmann::json toJson(const WorkerStatus& status) {
    return {
        {"activeState", status.activeState},
        {"subState", status.subState},
        {"mainPID", status.mainPid ? nlohmann::json(*status.mainPid) : nlohmann::json(nullptr)},
        {"since", optionalJson(status.since)},
        {"lastExit", optionalJson(status.lastExit)},
    };
}

nlohmann::json toJson(const OverviewSnapshot& snapshot) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& job : snapshot.queue.items) {
        items.push_back(toJson(job));
    }
    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : snapshot.events) {
        events.push_back(toJson(event));
    }
    return {
        {"worker", toJson(snapshot.worker)},
        {"queue", {{"size", snapshot.queue.size}, {"items", items}}},
        {"events", events},
    };
}

}

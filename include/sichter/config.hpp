/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sichter {

// Settings for every component. Built once in main() and passed down;
// nothing below the CLI reads the environment.
struct Config {
    std::filesystem::path stateDir;

    // Gateway
    std::string host = "127.0.0.1";
    std::uint16_t port = 5055;
    std::size_t replay = 10;
    std::chrono::seconds heartbeat{10};
    std::size_t recentDefault = 200;
    std::size_t recentMax = 5000;
    std::size_t backlogLimit = 200;
    int rateLimit = 120;           // requests per client per minute
    int maxConnections = 64;
    std::vector<std::string> allowedOrigins{"http://localhost:3000"};
    std::string workerUnit = "sichter-worker.service";
    std::size_t overviewEvents = 50;

    // Worker
    std::chrono::milliseconds idleInterval{2000};
    std::vector<std::string> repos;
    std::string org = "heimgewebe";
    std::string checkCommand = "sichter-check {repo} {mode}";
    std::string prCommand = "sichter-pr {repos}";
    bool fsync = true;

    // Stream client
    std::chrono::milliseconds pollInterval{5000};
    std::chrono::milliseconds pushRetryInterval{30000};
    std::size_t bufferLimit = 200;

    [[nodiscard]] std::filesystem::path queueDir() const { return stateDir / "queue"; }
    [[nodiscard]] std::filesystem::path eventsDir() const { return stateDir / "events"; }
    [[nodiscard]] std::filesystem::path logsDir() const { return stateDir / "logs"; }
    [[nodiscard]] std::filesystem::path eventLogPath() const { return eventsDir() / "events.jsonl"; }

    // Defaults overridden by SICHTER_* / XDG_STATE_HOME variables.
    [[nodiscard]] static Config fromEnv();
    // Defaults rooted at an explicit directory; ignores the environment.
    [[nodiscard]] static Config forStateDir(const std::filesystem::path& stateDir);

    [[nodiscard]] bool createDirectories() const noexcept;
};

[[nodiscard]] std::vector<std::string> splitList(const std::string& value, char sep = ',');

}

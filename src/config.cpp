/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/config.hpp"
#include "sichter/logger.hpp"
#include <cstdlib>

namespace sichter {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::filesystem::path defaultStateDir() {
    if (const char* dir = std::getenv("SICHTER_STATE_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "sichter";
    }
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home && *home ? std::filesystem::path(home) : std::filesystem::current_path();
    return base / ".local" / "state" / "sichter";
}
}

std::vector<std::string> splitList(const std::string& value, char sep) {
    std::vector<std::string> out;
    std::string::size_type pos = 0;
    while (pos <= value.size()) {
        auto next = value.find(sep, pos);
        if (next == std::string::npos) {
            next = value.size();
        }
        std::string item = trim(value.substr(pos, next - pos));
        if (!item.empty()) {
            out.push_back(item);
        }
        pos = next + 1;
    }
    return out;
}

Config Config::forStateDir(const std::filesystem::path& stateDir) {
    Config config;
    config.stateDir = stateDir;
    return config;
}

Config Config::fromEnv() {
    Config config = forStateDir(defaultStateDir());

    config.host = env_string("SICHTER_API_HOST", config.host);
    std::size_t port = env_size("SICHTER_API_PORT", config.port);
    if (port > 65535) {
        LOG_WARN("SICHTER_API_PORT out of range, using " + std::to_string(config.port));
    } else {
        config.port = static_cast<std::uint16_t>(port);
    }

    config.replay = env_size("SICHTER_REPLAY", config.replay);
    config.heartbeat = std::chrono::seconds(env_size("SICHTER_HEARTBEAT", config.heartbeat.count()));
    config.idleInterval = std::chrono::milliseconds(env_size("SICHTER_IDLE_MS", config.idleInterval.count()));
    config.pollInterval = std::chrono::milliseconds(env_size("SICHTER_POLL_MS", config.pollInterval.count()));
    config.pushRetryInterval = std::chrono::milliseconds(
        env_size("SICHTER_PUSH_RETRY_MS", config.pushRetryInterval.count()));
    config.bufferLimit = env_size("SICHTER_BUFFER", config.bufferLimit);
    config.backlogLimit = env_size("SICHTER_BACKLOG", config.backlogLimit);
    config.rateLimit = static_cast<int>(env_size("SICHTER_RATE_LIMIT", config.rateLimit));
    config.maxConnections = static_cast<int>(env_size("SICHTER_MAX_CONNECTIONS", config.maxConnections));

    if (const char* origins = std::getenv("SICHTER_DASHBOARD_ORIGINS"); origins && *origins) {
        config.allowedOrigins = splitList(origins);
    }
    if (const char* repos = std::getenv("SICHTER_REPOS"); repos && *repos) {
        config.repos = splitList(repos);
    }

    config.org = env_string("SICHTER_ORG", config.org);
    config.checkCommand = env_string("SICHTER_CHECK_CMD", config.checkCommand);
    config.prCommand = env_string("SICHTER_PR_CMD", config.prCommand);
    config.workerUnit = env_string("SICHTER_WORKER_UNIT", config.workerUnit);

    if (const char* fsync = std::getenv("SICHTER_FSYNC"); fsync && *fsync) {
        config.fsync = std::string(fsync) != "0";
    }

    return config;
}

bool Config::createDirectories() const noexcept {
    try {
        std::filesystem::create_directories(queueDir() / "writing");
        std::filesystem::create_directories(queueDir() / "ready");
        std::filesystem::create_directories(queueDir() / "processing");
        std::filesystem::create_directories(eventsDir());
        std::filesystem::create_directories(logsDir());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create state directories under " + stateDir.string() + ": " + e.what());
        return false;
    }
}

}

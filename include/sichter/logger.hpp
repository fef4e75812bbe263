/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace sichter {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Mirrors every line into `path` (appending) in addition to stderr.
    [[nodiscard]] static bool openFile(const std::filesystem::path& path) noexcept;
    static void closeFile() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parseLevel(const std::string& name, LogLevel fallback) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Shown in place of the thread id
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::sichter::Logger::error(msg)
#define LOG_WARN(msg)  ::sichter::Logger::warn(msg)
#define LOG_INFO(msg)  ::sichter::Logger::info(msg)
#define LOG_DEBUG(msg) ::sichter::Logger::debug(msg)
#define LOG_TRACE(msg) ::sichter::Logger::trace(msg)

/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace sichter {

namespace {
std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
bool g_level_initialized = false;
std::unordered_map<std::thread::id, std::string> g_thread_names;
std::ofstream g_file;

std::string threadLabel() {
    auto tid = std::this_thread::get_id();
    auto it = g_thread_names.find(tid);
    if (it != g_thread_names.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}

std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::openFile(const std::filesystem::path& path) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_file.is_open()) {
            g_file.close();
        }
        g_file.open(path, std::ios::app);
        return static_cast<bool>(g_file);
    } catch (const std::exception& e) {
        std::cerr << "Cannot open log file " << path << ": " << e.what() << std::endl;
        return false;
    }
}

void Logger::closeFile() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_file.is_open()) {
        g_file.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
        return;
    }

    try {
        std::string stamp = timestampNow();
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::string line = "[" + stamp + "] [" + levelToString(level) + "] [" + threadLabel() + "] " + message;

        // stdout belongs to the CLI tools
        std::cerr << line << std::endl;
        if (g_file.is_open()) {
            g_file << line << '\n';
            if (level <= LogLevel::WARN) {
                g_file.flush();
            }
        }
    } catch (const std::exception&) {
        std::fputs("sichter: log write failed\n", stderr);
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) noexcept {
    std::string lowered;
    for (char c : name) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "trace") return LogLevel::TRACE;
    return fallback;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env = std::getenv("SICHTER_LOG_LEVEL");
    return env ? parseLevel(env, LogLevel::INFO) : LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKN ";
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

// Thread ids get reused; connection threads drop their name on exit
void clearThreadName() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names.erase(std::this_thread::get_id());
}

}

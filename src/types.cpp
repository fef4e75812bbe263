/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/types.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sichter {

const char* toString(JobType type) noexcept {
    switch (type) {
        case JobType::ScanChanged: return "ScanChanged";
        case JobType::ScanAll: return "ScanAll";
        case JobType::PRSweep: return "PRSweep";
        default: return "Unknown";
    }
}

const char* toString(ScanMode mode) noexcept {
    switch (mode) {
        case ScanMode::Changed: return "changed";
        case ScanMode::All: return "all";
        default: return "unknown";
    }
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Collaborator: return "collaborator";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Storage: return "storage";
        default: return "unknown";
    }
}

std::optional<JobType> parseJobType(const std::string& value) noexcept {
    if (value == "ScanChanged") return JobType::ScanChanged;
    if (value == "ScanAll") return JobType::ScanAll;
    if (value == "PRSweep") return JobType::PRSweep;
    return std::nullopt;
}

std::optional<ScanMode> parseScanMode(const std::string& value) noexcept {
    if (value == "changed") return ScanMode::Changed;
    if (value == "all") return ScanMode::All;
    return std::nullopt;
}

std::string formatTimestamp(Timestamp ts) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    long millis = static_cast<long>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << millis << "Z";
    return ss.str();
}

std::optional<Timestamp> parseTimestamp(const std::string& value) noexcept {
    try {
        std::tm utc{};
        std::istringstream ss(value);
        ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }

        long millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            std::string digits;
            while (std::isdigit(ss.peek())) {
                digits += static_cast<char>(ss.get());
            }
            digits = (digits + "000").substr(0, 3);
            millis = std::stol(digits);
        }

        // Only UTC designators are produced by this codebase
        std::string zone;
        ss >> zone;
        if (!zone.empty() && zone != "Z" && zone != "+00:00") {
            return std::nullopt;
        }

        std::time_t secs = timegm(&utc);
        return Timestamp(std::chrono::seconds(secs) + std::chrono::milliseconds(millis));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}

/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "sichter/types.hpp"

namespace sichter {

// One record of the event log. Immutable once appended.
struct Event {
    std::uint64_t seq = 0;          // 1-based position in the log, 0 = not yet appended
    Timestamp ts{};
    std::string kind;               // "job.started", "job.done", "heartbeat", ...
    std::optional<std::string> line;
    nlohmann::json payload;         // null when absent
};

[[nodiscard]] nlohmann::json toJson(const Event& event);
[[nodiscard]] std::optional<Event> eventFromJson(const nlohmann::json& value) noexcept;
[[nodiscard]] std::optional<Event> parseEventLine(const std::string& line) noexcept;

// Convenience accessor for payload["job_id"]; empty when missing.
[[nodiscard]] std::string eventJobId(const Event& event);

}

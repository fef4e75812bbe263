/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/event.hpp"

namespace sichter {

nlohmann::json toJson(const Event& event) {
    nlohmann::json j;
    j["seq"] = event.seq;
    j["ts"] = formatTimestamp(event.ts);
    j["kind"] = event.kind;
    if (event.line) {
        j["line"] = *event.line;
    }
    if (!event.payload.is_null()) {
        j["payload"] = event.payload;
    }
    return j;
}

std::optional<Event> eventFromJson(const nlohmann::json& value) noexcept {
    try {
        if (!value.is_object()) {
            return std::nullopt;
        }

        Event event;
        event.kind = value.value("kind", std::string());
        if (event.kind.empty()) {
            return std::nullopt;
        }
        event.seq = value.value("seq", std::uint64_t{0});

        auto ts = parseTimestamp(value.value("ts", std::string()));
        if (!ts) {
            return std::nullopt;
        }
        event.ts = *ts;

        if (auto it = value.find("line"); it != value.end() && it->is_string()) {
            event.line = it->get<std::string>();
        }
        if (auto it = value.find("payload"); it != value.end()) {
            event.payload = *it;
        }
        return event;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Event> parseEventLine(const std::string& line) noexcept {
    try {
        auto value = nlohmann::json::parse(line, nullptr, false);
        if (value.is_discarded()) {
            return std::nullopt;
        }
        return eventFromJson(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string eventJobId(const Event& event) {
    if (!event.payload.is_object()) {
        return "";
    }
    auto it = event.payload.find("job_id");
    if (it == event.payload.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}

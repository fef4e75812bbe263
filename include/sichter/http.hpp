/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace sichter {

struct HttpRequest {
    std::string method;
    std::string target;                          // as sent, path + query
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;  // keys lowercased
    std::string body;

    [[nodiscard]] std::string header(const std::string& name) const;
    [[nodiscard]] std::string param(const std::string& name, const std::string& fallback = "") const;
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    [[nodiscard]] static HttpResponse json(int status, const nlohmann::json& body);
    [[nodiscard]] static HttpResponse text(int status, std::string body);
    [[nodiscard]] static HttpResponse error(int status, const std::string& message);
};

// Client-side result of one request/response exchange.
struct HttpResult {
    bool ok = false;              // a response was received
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string error;
};

[[nodiscard]] const char* statusText(int status) noexcept;
[[nodiscard]] std::string urlDecode(const std::string& value);
[[nodiscard]] std::map<std::string, std::string> parseQuery(const std::string& query);

// Request line and headers, without the terminating blank line.
[[nodiscard]] bool parseRequestHead(const std::string& head, HttpRequest& request) noexcept;
// Reads one request. On false, `error` is empty when the peer simply went away.
[[nodiscard]] bool readRequest(int fd, HttpRequest& request, std::size_t maxBody, std::string& error);

[[nodiscard]] std::string serializeResponse(const HttpResponse& response);
[[nodiscard]] bool sendAll(int fd, const std::string& data) noexcept;
void setSocketTimeouts(int fd, std::chrono::milliseconds timeout) noexcept;

// Blocking TCP connect with send/receive timeouts applied. Returns -1 on failure.
[[nodiscard]] int connectTo(const std::string& host, std::uint16_t port,
                            std::chrono::milliseconds timeout, std::string& error);
// Reads the status line and headers; bytes past the head are left in `rest`.
[[nodiscard]] bool readResponseHead(int fd, HttpResult& result, std::string& rest);
[[nodiscard]] HttpResult httpRequest(const std::string& host, std::uint16_t port,
                                     const std::string& method, const std::string& target,
                                     const std::string& body, std::chrono::milliseconds timeout);

}

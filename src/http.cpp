/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/http.hpp"
#include "sichter/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace sichter {

namespace {
constexpr std::size_t kMaxHead = 16 * 1024;

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

// Parses "Key: value" lines after the first line of a head.
void parseHeaderLines(std::istringstream& in, std::map<std::string, std::string>& headers) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
}

// Receives until "\r\n\r\n"; returns false on EOF, error or an oversized head.
bool recvHead(int fd, std::string& head, std::string& rest, std::string& error) {
    std::string buf;
    std::array<char, 4096> chunk;
    while (true) {
        auto end = buf.find("\r\n\r\n");
        if (end != std::string::npos) {
            head = buf.substr(0, end);
            rest = buf.substr(end + 4);
            return true;
        }
        if (buf.size() > kMaxHead) {
            error = "request head too large";
            return false;
        }
        ssize_t n = ::recv(fd, chunk.data(), chunk.size(), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            if (n < 0 && !buf.empty()) {
                error = std::string("receive failed: ") + std::strerror(errno);
            }
            return false;
        }
        buf.append(chunk.data(), static_cast<std::size_t>(n));
    }
}

bool parseLength(const std::string& value, std::size_t& length) noexcept {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        length = static_cast<std::size_t>(std::stoull(value));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::param(const std::string& name, const std::string& fallback) const {
    auto it = query.find(name);
    return it == query.end() ? fallback : it->second;
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return response;
}

HttpResponse HttpResponse::text(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.contentType = "text/plain; charset=utf-8";
    response.body = std::move(body);
    return response;
}

HttpResponse HttpResponse::error(int status, const std::string& message) {
    return json(status, {{"error", message}});
}

const char* statusText(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::map<std::string, std::string> parseQuery(const std::string& query) {
    std::map<std::string, std::string> params;
    std::string::size_type pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                params[urlDecode(pair)] = "";
            } else {
                params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
    return params;
}

bool parseRequestHead(const std::string& head, HttpRequest& request) noexcept {
    try {
        std::istringstream in(head);
        std::string requestLine;
        if (!std::getline(in, requestLine)) {
            return false;
        }
        if (!requestLine.empty() && requestLine.back() == '\r') {
            requestLine.pop_back();
        }

        std::istringstream rl(requestLine);
        std::string version;
        if (!(rl >> request.method >> request.target >> version)) {
            return false;
        }
        if (version.rfind("HTTP/", 0) != 0 || request.target.empty() || request.target[0] != '/') {
            return false;
        }

        auto qmark = request.target.find('?');
        request.path = request.target.substr(0, qmark);
        request.query = qmark == std::string::npos ? std::map<std::string, std::string>{}
                                                   : parseQuery(request.target.substr(qmark + 1));
        request.headers.clear();
        parseHeaderLines(in, request.headers);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool readRequest(int fd, HttpRequest& request, std::size_t maxBody, std::string& error) {
    error.clear();
    std::string head;
    std::string rest;
    if (!recvHead(fd, head, rest, error)) {
        return false;
    }
    if (!parseRequestHead(head, request)) {
        error = "malformed request";
        return false;
    }

    std::size_t length = 0;
    std::string lengthHeader = request.header("content-length");
    if (!lengthHeader.empty() && !parseLength(lengthHeader, length)) {
        error = "invalid Content-Length";
        return false;
    }
    if (length > maxBody) {
        error = "request body too large";
        return false;
    }

    request.body = rest.substr(0, std::min(rest.size(), length));
    std::array<char, 4096> chunk;
    while (request.body.size() < length) {
        ssize_t n = ::recv(fd, chunk.data(), std::min(chunk.size(), length - request.body.size()), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            error = "truncated request body";
            return false;
        }
        request.body.append(chunk.data(), static_cast<std::size_t>(n));
    }
    return true;
}

std::string serializeResponse(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << statusText(response.status) << "\r\n";
    if (response.status != 204) {
        out << "Content-Type: " << response.contentType << "\r\n";
    }
    out << "Content-Length: " << response.body.size() << "\r\n";
    for (const auto& [name, value] : response.headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "Connection: close\r\n\r\n";
    out << response.body;
    return out.str();
}

bool sendAll(int fd, const std::string& data) noexcept {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

void setSocketTimeouts(int fd, std::chrono::milliseconds timeout) noexcept {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

int connectTo(const std::string& host, std::uint16_t port,
              std::chrono::milliseconds timeout, std::string& error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
    if (rc != 0) {
        error = "resolve " + host + ": " + ::gai_strerror(rc);
        return -1;
    }

    int fd = -1;
    for (addrinfo* ai = found; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        // Linux applies SO_SNDTIMEO to connect()
        setSocketTimeouts(fd, timeout);
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        error = "connect " + host + ":" + service + ": " + std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(found);
    return fd;
}

bool readResponseHead(int fd, HttpResult& result, std::string& rest) {
    std::string head;
    std::string error;
    if (!recvHead(fd, head, rest, error)) {
        result.error = error.empty() ? "connection closed before response" : error;
        return false;
    }

    std::istringstream in(head);
    std::string statusLine;
    std::getline(in, statusLine);
    std::istringstream sl(statusLine);
    std::string version;
    if (!(sl >> version >> result.status) || version.rfind("HTTP/", 0) != 0) {
        result.error = "malformed response";
        return false;
    }
    parseHeaderLines(in, result.headers);
    result.ok = true;
    return true;
}

HttpResult httpRequest(const std::string& host, std::uint16_t port,
                       const std::string& method, const std::string& target,
                       const std::string& body, std::chrono::milliseconds timeout) {
    HttpResult result;
    int fd = connectTo(host, port, timeout, result.error);
    if (fd < 0) {
        return result;
    }

    std::ostringstream out;
    out << method << " " << target << " HTTP/1.1\r\n"
        << "Host: " << host << ":" << port << "\r\n"
        << "Accept: application/json\r\n"
        << "Connection: close\r\n";
    if (!body.empty() || method == "POST") {
        out << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    }
    out << "\r\n" << body;

    if (!sendAll(fd, out.str())) {
        result.error = std::string("send failed: ") + std::strerror(errno);
        ::close(fd);
        return result;
    }

    std::string rest;
    if (!readResponseHead(fd, result, rest)) {
        ::close(fd);
        return result;
    }

    std::size_t length = 0;
    bool haveLength = parseLength(result.headers["content-length"], length);
    result.body = std::move(rest);

    std::array<char, 4096> chunk;
    while (!haveLength || result.body.size() < length) {
        ssize_t n = ::recv(fd, chunk.data(), chunk.size(), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            break;
        }
        if (n < 0) {
            result.ok = false;
            result.error = std::string("receive failed: ") + std::strerror(errno);
            break;
        }
        result.body.append(chunk.data(), static_cast<std::size_t>(n));
    }
    if (haveLength && result.body.size() > length) {
        result.body.resize(length);
    }
    if (result.ok && haveLength && result.body.size() < length) {
        result.ok = false;
        result.error = "truncated response body";
    }

    ::close(fd);
    return result;
}

}

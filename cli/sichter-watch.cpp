/*
 * sichter - Event watcher (sichter-watch)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/config.hpp"
#include "sichter/logger.hpp"
#include "sichter/stream_client.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <thread>

using namespace sichter;

static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "sichter Event Watcher\n\n";
    std::cout << "Usage: " << progName << " [--host <addr>] [--port <n>] [--json]\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - Follows the live event stream of sichter-api\n";
    std::cout << "  - Falls back to polling while the stream is down\n\n";
    std::cout << "Options:\n";
    std::cout << "  --host <addr>   API host (default 127.0.0.1)\n";
    std::cout << "  --port <n>      API port (default 5055)\n";
    std::cout << "  --json          Print raw event JSON, one per line\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SICHTER_POLL_MS    Poll interval while disconnected (default 5000)\n";
    std::cout << "  SICHTER_LOG_LEVEL  Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for terminal usage
    if (!std::getenv("SICHTER_LOG_LEVEL")) {
        Logger::setLevel(LogLevel::WARN);
    } else {
        Logger::initFromEnv();
    }

    Config config = Config::fromEnv();
    bool json = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--host" && i + 1 < argc) {
            config.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                config.port = static_cast<std::uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port\n";
                return 1;
            }
        } else if (arg == "--json") {
            json = true;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::mutex printMutex;
    std::uint64_t lastPrinted = 0;
    bool wasConnected = false;
    bool first = true;

    StreamClient client(config, [&](const StreamView& view) {
        std::lock_guard<std::mutex> lock(printMutex);
        if (first || view.connected != wasConnected) {
            if (view.connected) {
                std::cerr << "[live] streaming from " << config.host << ":" << config.port << std::endl;
            } else {
                std::cerr << "[poll] " << (view.error.empty() ? "stream unavailable" : view.error)
                          << ", polling every " << config.pollInterval.count() << "ms" << std::endl;
            }
            wasConnected = view.connected;
            first = false;
        }

        for (const auto& event : view.events) {
            if (event.seq <= lastPrinted) {
                continue;
            }
            lastPrinted = event.seq;
            if (json) {
                std::cout << toJson(event).dump() << std::endl;
            } else {
                std::cout << formatTimestamp(event.ts) << "  " << event.kind;
                if (event.line) {
                    std::cout << "  " << *event.line;
                } else if (auto id = eventJobId(event); !id.empty()) {
                    std::cout << "  " << id;
                }
                std::cout << std::endl;
            }
        }
    });

    if (!client.start()) {
        std::cerr << "Error: Failed to start stream client\n";
        return 1;
    }

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    client.stop();
    return 0;
}

/*
 * sichter - HTTP gateway (sichter-api)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/config.hpp"
#include "sichter/event_log.hpp"
#include "sichter/gateway.hpp"
#include "sichter/logger.hpp"
#include "sichter/overview.hpp"
#include "sichter/queue.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace sichter;

constexpr const char* VERSION = "0.1.0";

static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "sichter API gateway v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --host <addr>       Listen address (default 127.0.0.1)\n";
    std::cout << "  --port <n>          Listen port (default 5055)\n";
    std::cout << "  --state <dir>       State directory shared with sichterd\n";
    std::cout << "  --replay <n>        Events replayed to new streams (default 10)\n";
    std::cout << "  --heartbeat <s>     Idle stream heartbeat in seconds (default 10)\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Endpoints:\n";
    std::cout << "  GET  /healthz /readyz\n";
    std::cout << "  POST /api/jobs/submit\n";
    std::cout << "  GET  /api/events/recent?n=200\n";
    std::cout << "  GET  /api/overview\n";
    std::cout << "  GET  /events/stream?replay=10&heartbeat=10\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SICHTER_RATE_LIMIT         Requests per client per minute (default 120)\n";
    std::cout << "  SICHTER_DASHBOARD_ORIGINS  Allowed CORS origins\n";
    std::cout << "  SICHTER_LOG_LEVEL          Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    setThreadName("Main");

    Config config = Config::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        try {
            if (arg == "--host" && i + 1 < argc) {
                config.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                int port = std::stoi(argv[++i]);
                if (port < 0 || port > 65535) {
                    std::cerr << "Error: Port out of range\n";
                    return 1;
                }
                config.port = static_cast<std::uint16_t>(port);
            } else if (arg == "--state" && i + 1 < argc) {
                config.stateDir = argv[++i];
            } else if (arg == "--replay" && i + 1 < argc) {
                config.replay = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--heartbeat" && i + 1 < argc) {
                config.heartbeat = std::chrono::seconds(std::stol(argv[++i]));
            } else {
                std::cerr << "Error: Unknown argument: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << "\n";
            return 1;
        }
    }

    // Writing to disconnected clients must not kill the process
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!config.createDirectories()) {
        std::cerr << "Error: Cannot create state directory " << config.stateDir << "\n";
        return 1;
    }
    if (!Logger::openFile(config.logsDir() / "sichter-api.log")) {
        LOG_WARN("Logging to stderr only, cannot open " + (config.logsDir() / "sichter-api.log").string());
    }

    try {
        Queue queue(config);
        EventLog log(config.eventLogPath());
        SystemdProbe probe(config.workerUnit);
        Overview overview(queue, log, probe, config.overviewEvents);
        Gateway gateway(config, queue, log, overview);

        if (!gateway.start()) {
            std::cerr << "Error: Failed to start gateway on " << config.host << ":" << config.port << "\n";
            return 1;
        }

        while (!g_shutdown_requested && gateway.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, closing connections...");
        gateway.stop();

    } catch (const std::exception& e) {
        LOG_ERROR("Gateway error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

/*
 * sichter - Worker daemon (sichterd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/collaborators.hpp"
#include "sichter/config.hpp"
#include "sichter/event_log.hpp"
#include "sichter/logger.hpp"
#include "sichter/queue.hpp"
#include "sichter/worker.hpp"
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>
#include <unistd.h>

using namespace sichter;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "sichter worker daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --state <dir>       State directory (queue/, events/, logs/)\n";
    std::cout << "  --once              Drain the queue once and exit\n";
    std::cout << "  --idle-ms <n>       Sleep between empty queue passes (default 2000)\n";
    std::cout << "  --repos <a,b,...>   Repository set for jobs without a repo\n";
    std::cout << "  --check-cmd <tmpl>  Check command, placeholders {repo} {mode} {org}\n";
    std::cout << "  --pr-cmd <tmpl>     PR command, placeholder {repos}\n";
    std::cout << "  --no-fsync          Do not fsync event log appends\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SICHTER_STATE_DIR   State directory (default $XDG_STATE_HOME/sichter)\n";
    std::cout << "  SICHTER_REPOS       Comma separated repository set\n";
    std::cout << "  SICHTER_CHECK_CMD   Check command template\n";
    std::cout << "  SICHTER_PR_CMD      PR command template\n";
    std::cout << "  SICHTER_LOG_LEVEL   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    setThreadName("Main");

    Config config = Config::fromEnv();
    bool once = false;

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
        if (arg == "--state" && i + 1 < argc) {
            config.stateDir = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--idle-ms" && i + 1 < argc) {
            try {
                config.idleInterval = std::chrono::milliseconds(std::stol(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid idle interval\n";
                return 1;
            }
        } else if (arg == "--repos" && i + 1 < argc) {
            config.repos = splitList(argv[++i]);
        } else if (arg == "--check-cmd" && i + 1 < argc) {
            config.checkCommand = argv[++i];
        } else if (arg == "--pr-cmd" && i + 1 < argc) {
            config.prCommand = argv[++i];
        } else if (arg == "--no-fsync") {
            config.fsync = false;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    for (const auto& repo : config.repos) {
        if (!Queue::isValidRepo(repo)) {
            std::cerr << "Error: Invalid repository name: " << repo << "\n";
            return 1;
        }
    }

    if (!config.createDirectories()) {
        std::cerr << "Error: Cannot create state directory " << config.stateDir << "\n";
        return 1;
    }
    if (!Logger::openFile(config.logsDir() / "sichterd.log")) {
        LOG_WARN("Logging to stderr only, cannot open " + (config.logsDir() / "sichterd.log").string());
    }

    std::filesystem::path pidPath = config.stateDir / "sichterd.pid";
    if (auto pid = readPidFile(pidPath)) {
        if (*pid != ::getpid() && isProcessAlive(*pid)) {
            std::cerr << "Error: sichterd already running (pid " << *pid << ")\n";
            return 1;
        }
        LOG_WARN("Removing stale pid file for pid " + std::to_string(*pid));
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Queue queue(config);
        EventLog log(config.eventLogPath(), config.fsync);
        CommandCheckRunner checks(config.checkCommand, config.org);
        CommandPrPublisher publisher(config.prCommand, config.org);

        std::size_t recovered = queue.recover();
        if (recovered > 0) {
            LOG_WARN("Recovered " + std::to_string(recovered) + " interrupted job(s)");
        }

        Worker worker(config, queue, log, checks, publisher);

        if (once) {
            std::size_t handled = 0;
            while (!g_shutdown_requested && worker.runOnce()) {
                ++handled;
            }
            LOG_INFO("Processed " + std::to_string(handled) + " job(s), " +
                     std::to_string(worker.failed()) + " failed");
            return worker.failed() > 0 ? 1 : 0;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << ::getpid();
            }
        }

        if (!worker.start()) {
            std::cerr << "Error: Failed to start worker\n";
            return 1;
        }

        LOG_INFO("sichterd " + std::string(VERSION) + " running, state " + config.stateDir.string());

        while (!g_shutdown_requested && worker.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            LOG_INFO("Shutdown requested, finishing current job...");
        }
        worker.stop();
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }

        if (auto fatal = worker.fatalError()) {
            LOG_ERROR("Worker stopped on fatal error: " + *fatal);
            return 2;
        }

    } catch (const StorageError& e) {
        LOG_ERROR("Storage error: " + std::string(e.what()));
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Daemon error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("sichterd stopped");
    return 0;
}

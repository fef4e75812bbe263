/*
 * sichter - Job submission tool (sichter-enqueue)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/config.hpp"
#include "sichter/logger.hpp"
#include "sichter/queue.hpp"
#include <cstdlib>
#include <iostream>

using namespace sichter;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "sichter Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <type> [--mode changed|all] [--repo <owner/name>] [--no-pr]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  type          ScanChanged, ScanAll or PRSweep\n\n";
    std::cout << "Options:\n";
    std::cout << "  --mode <m>      changed (default) or all\n";
    std::cout << "  --repo <r>      Single repository; default is the configured set\n";
    std::cout << "  --no-pr         Do not open pull requests after the scan\n";
    std::cout << "  --state <dir>   State directory\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SICHTER_STATE_DIR   State directory\n";
    std::cout << "  SICHTER_LOG_LEVEL   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ScanChanged --repo heimgewebe/wgx\n";
    std::cout << "  " << progName << " ScanAll --no-pr\n";
    std::cout << "  " << progName << " PRSweep\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; SICHTER_LOG_LEVEL overrides
    if (!std::getenv("SICHTER_LOG_LEVEL")) {
        Logger::setLevel(LogLevel::WARN);
    } else {
        Logger::initFromEnv();
    }

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
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Config config = Config::fromEnv();
    JobSpec spec;
    spec.type = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            spec.mode = argv[++i];
        } else if (arg == "--repo" && i + 1 < argc) {
            spec.repo = std::string(argv[++i]);
        } else if (arg == "--no-pr") {
            spec.autoPr = false;
        } else if (arg == "--state" && i + 1 < argc) {
            config.stateDir = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    try {
        Queue queue(config, true);
        SubmitResult result = queue.submit(spec);
        if (result) {
            // Just the job ID - clean for piping
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return result.error == ErrorKind::Validation ? 2 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

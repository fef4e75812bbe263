/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/collaborators.hpp"
#include "sichter/logger.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

namespace sichter {

CommandCheckRunner::CommandCheckRunner(std::string commandTemplate, std::string org)
    : template_(std::move(commandTemplate)), org_(std::move(org)) {
}

CollaboratorResult CommandCheckRunner::run(const std::string& repo, ScanMode mode) {
    std::string command = expandCommand(template_, {
        {"repo", shellQuote(repo)},
        {"mode", shellQuote(toString(mode))},
        {"org", shellQuote(org_)},
    });
    LOG_DEBUG("Check runner: " + command);
    return runCommand(command);
}

CommandPrPublisher::CommandPrPublisher(std::string commandTemplate, std::string org)
    : template_(std::move(commandTemplate)), org_(std::move(org)) {
}

CollaboratorResult CommandPrPublisher::publish(const std::vector<std::string>& repos) {
    std::string quoted;
    for (const auto& repo : repos) {
        if (!quoted.empty()) quoted += " ";
        quoted += shellQuote(repo);
    }
    std::string command = expandCommand(template_, {{"repos", quoted}, {"org", shellQuote(org_)}});
    LOG_DEBUG("PR publisher: " + command);
    return runCommand(command);
}

std::string shellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string expandCommand(const std::string& tmpl,
                          const std::vector<std::pair<std::string, std::string>>& vars) {
    std::string out;
    std::string::size_type pos = 0;
    while (pos < tmpl.size()) {
        auto open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out += tmpl.substr(pos);
            break;
        }
        auto close = tmpl.find('}', open);
        if (close == std::string::npos) {
            out += tmpl.substr(pos);
            break;
        }

        out += tmpl.substr(pos, open - pos);
        std::string name = tmpl.substr(open + 1, close - open - 1);
        bool matched = false;
        for (const auto& [key, value] : vars) {
            if (key == name) {
                out += value;
                matched = true;
                break;
            }
        }
        if (!matched) {
            out += tmpl.substr(open, close - open + 1);
        }
        pos = close + 1;
    }
    return out;
}

CollaboratorResult runCommand(const std::string& command, std::size_t maxOutput) {
    CollaboratorResult result;

    FILE* pipe = ::popen((command + " 2>&1").c_str(), "r");
    if (!pipe) {
        result.error = std::string("Failed to start command: ") + std::strerror(errno);
        return result;
    }

    std::array<char, 4096> buf;
    std::size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        result.output.append(buf.data(), n);
        if (result.output.size() > maxOutput * 2) {
            result.output.erase(0, result.output.size() - maxOutput);
        }
    }
    if (result.output.size() > maxOutput) {
        result.output.erase(0, result.output.size() - maxOutput);
    }

    int status = ::pclose(pipe);
    if (status == -1) {
        result.error = std::string("Failed to wait for command: ") + std::strerror(errno);
    } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        result.success = true;
    } else if (WIFEXITED(status)) {
        result.error = "exit status " + std::to_string(WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        result.error = "killed by signal " + std::to_string(WTERMSIG(status));
    } else {
        result.error = "abnormal termination";
    }
    return result;
}

}

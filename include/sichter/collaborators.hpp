/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <utility>
#include <vector>

#include "sichter/types.hpp"

namespace sichter {

struct CollaboratorResult {
    bool success = false;
    std::string output;
    std::string error;
};

// Runs the static analyzers for one repository.
class CheckRunner {
public:
    virtual ~CheckRunner() = default;
    [[nodiscard]] virtual CollaboratorResult run(const std::string& repo, ScanMode mode) = 0;
};

// Opens or updates pull requests for a set of repositories.
class PrPublisher {
public:
    virtual ~PrPublisher() = default;
    [[nodiscard]] virtual CollaboratorResult publish(const std::vector<std::string>& repos) = 0;
};

// Shell command template, e.g. "sichter-check {repo} {mode}". {org} is
// also available for checks that clone by owner.
class CommandCheckRunner final : public CheckRunner {
public:
    explicit CommandCheckRunner(std::string commandTemplate, std::string org = "");
    [[nodiscard]] CollaboratorResult run(const std::string& repo, ScanMode mode) override;

private:
    std::string template_;
    std::string org_;
};

// Shell command template, e.g. "sichter-pr {repos}".
class CommandPrPublisher final : public PrPublisher {
public:
    explicit CommandPrPublisher(std::string commandTemplate, std::string org = "");
    [[nodiscard]] CollaboratorResult publish(const std::vector<std::string>& repos) override;

private:
    std::string template_;
    std::string org_;
};

[[nodiscard]] std::string shellQuote(const std::string& value);
// Replaces {name} placeholders; values are inserted verbatim.
[[nodiscard]] std::string expandCommand(const std::string& tmpl,
                                        const std::vector<std::pair<std::string, std::string>>& vars);
// Runs through /bin/sh, capturing stdout+stderr (last maxOutput bytes).
[[nodiscard]] CollaboratorResult runCommand(const std::string& command, std::size_t maxOutput = 64 * 1024);

}

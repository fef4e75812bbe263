/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "sichter/collaborators.hpp"
#include "sichter/config.hpp"
#include "sichter/types.hpp"

namespace sichter {

class Queue;
class EventLog;

enum class JobOutcome : uint8_t {
    Succeeded,
    Failed
};

// The single consumer of the queue and the only writer of the event log.
class Worker final {
public:
    Worker(const Config& config, Queue& queue, EventLog& log,
           CheckRunner& checks, PrPublisher& publisher);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    // Runs the loop on a background thread.
    [[nodiscard]] bool start();
    // Lets the in-flight job finish, then joins.
    void stop() noexcept;

    // Blocking loop on the calling thread until stop() or a StorageError.
    void run();
    // Claims and processes at most one job. Throws StorageError.
    [[nodiscard]] bool runOnce();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::optional<std::string> fatalError() const;
    [[nodiscard]] std::uint64_t processed() const noexcept { return processed_.load(); }
    [[nodiscard]] std::uint64_t failed() const noexcept { return failed_.load(); }

private:
    JobOutcome process(const Job& job);
    CollaboratorResult execute(const Job& job);
    CollaboratorResult scan(const Job& job);
    CollaboratorResult sweep(const Job& job);
    [[nodiscard]] std::vector<std::string> targetRepos(const Job& job) const;
    void idle();
    void loop();

    Config config_;
    Queue& queue_;
    EventLog& log_;
    CheckRunner& checks_;
    PrPublisher& publisher_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> failed_{0};

    mutable std::mutex fatalMutex_;
    std::optional<std::string> fatal_;

    std::thread thread_;
};

}

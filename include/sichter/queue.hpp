/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sichter/config.hpp"
#include "sichter/types.hpp"

namespace sichter {

struct SubmitResult {
    bool ok = false;
    JobId id;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Durable FIFO of pending jobs, one JSON file per job:
//   queue/writing/     being written, invisible to claimers
//   queue/ready/       published, ordered by file name (= job id)
//   queue/processing/  the claimed job, until remove()
class Queue final {
public:
    explicit Queue(const Config& config, bool createIfMissing = true);

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;
    Queue(Queue&&) = delete;
    Queue& operator=(Queue&&) = delete;

    [[nodiscard]] SubmitResult submit(const JobSpec& spec);

    // Pending jobs (ready and claimed-but-not-removed), oldest first.
    [[nodiscard]] std::vector<Job> peekAll() const;
    [[nodiscard]] std::size_t size() const noexcept;

    // Exclusive and non-blocking: returns the oldest ready job, or nothing
    // when the queue is empty or another claim has not been removed yet.
    // Throws StorageError when the queue directory cannot be read.
    [[nodiscard]] std::optional<Job> claimNext();

    // Idempotent. Throws StorageError only if an existing file cannot be deleted.
    void remove(const JobId& id);

    // Moves jobs abandoned in processing/ back to ready/. Returns the count.
    std::size_t recover() noexcept;

    [[nodiscard]] bool isAvailable() const noexcept;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Checks a submission and builds the job it describes (id left empty).
    [[nodiscard]] static bool validate(const JobSpec& spec, Job& job, std::string& error);
    [[nodiscard]] static bool isValidRepo(const std::string& repo) noexcept;

private:
    std::filesystem::path root_;
    bool fsync_;
    mutable std::mutex claimMutex_;

    [[nodiscard]] bool createLayout(bool createIfMissing) noexcept;
    [[nodiscard]] static JobId generateId(Timestamp& issuedAt);
    [[nodiscard]] std::vector<std::filesystem::path> listJobs(const char* stage) const;
    [[nodiscard]] std::optional<Job> readJob(const std::filesystem::path& file) const noexcept;
    [[nodiscard]] bool writeDurable(const std::filesystem::path& file, const std::string& content) const noexcept;
    [[nodiscard]] bool atomicPublish(const JobId& id) const noexcept;
    void quarantine(const std::filesystem::path& file) const noexcept;
    void cleanupFailedJob(const JobId& id) const noexcept;
};

[[nodiscard]] nlohmann::json toJson(const Job& job);
[[nodiscard]] std::optional<Job> jobFromJson(const nlohmann::json& value) noexcept;
// Reads a submission body. Missing fields take JobSpec defaults; wrong types fail.
[[nodiscard]] bool jobSpecFromJson(const nlohmann::json& value, JobSpec& spec, std::string& error);

}

/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/worker.hpp"
#include "sichter/event_log.hpp"
#include "sichter/logger.hpp"
#include "sichter/queue.hpp"
#include <chrono>
#include <unistd.h>

namespace sichter {

namespace {
constexpr std::size_t kOutputTail = 2000;

std::string outputTail(const std::string& output) {
    if (output.size() <= kOutputTail) {
        return output;
    }
    return output.substr(output.size() - kOutputTail);
}

nlohmann::json jobPayload(const Job& job) {
    return {
        {"job_id", job.id},
        {"type", toString(job.type)},
        {"mode", toString(job.mode)},
        {"repo", job.repo ? nlohmann::json(*job.repo) : nlohmann::json(nullptr)},
    };
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += sep;
        out += part;
    }
    return out;
}
}

Worker::Worker(const Config& config, Queue& queue, EventLog& log,
               CheckRunner& checks, PrPublisher& publisher)
    : config_(config), queue_(queue), log_(log), checks_(checks), publisher_(publisher) {
    LOG_DEBUG("Worker created - idle interval: " + std::to_string(config_.idleInterval.count()) +
              "ms, repo set: " + std::to_string(config_.repos.size()));
}

Worker::~Worker() {
    stop();
}

bool Worker::start() {
    if (running_.load() || thread_.joinable()) {
        LOG_WARN("Worker already running");
        return false;
    }

    shutdown_.store(false);
    running_.store(true);
    try {
        thread_ = std::thread(&Worker::loop, this);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker thread: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Worker::stop() noexcept {
    if (!running_.load() && !thread_.joinable()) {
        return;
    }

    LOG_DEBUG("Stopping worker...");
    shutdown_.store(true);

    if (thread_.joinable()) {
        thread_.join();
    }
}

std::optional<std::string> Worker::fatalError() const {
    std::lock_guard<std::mutex> lock(fatalMutex_);
    return fatal_;
}

void Worker::loop() {
    setThreadName("Worker");
    try {
        run();
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(fatalMutex_);
            if (!fatal_) {
                fatal_ = e.what();
            }
        }
        LOG_ERROR("Worker loop terminated: " + std::string(e.what()));
    }
    running_.store(false);
}

void Worker::run() {
    running_.store(true);
    try {
        log_.append("worker.start", {{"pid", static_cast<long>(::getpid())}}, std::string("worker start"));
        LOG_INFO("Worker loop started");

        while (!shutdown_.load()) {
            if (!runOnce()) {
                idle();
            }
        }

        log_.append("worker.stop", {{"processed", processed_.load()}, {"failed", failed_.load()}},
                    std::string("worker stop"));
    } catch (const StorageError& e) {
        {
            std::lock_guard<std::mutex> lock(fatalMutex_);
            fatal_ = e.what();
        }
        running_.store(false);
        LOG_ERROR("Storage failure, worker loop cannot continue: " + std::string(e.what()));
        throw;
    }

    running_.store(false);
    LOG_INFO("Worker loop stopped after " + std::to_string(processed_.load()) + " job(s)");
}

bool Worker::runOnce() {
    auto job = queue_.claimNext();
    if (!job) {
        return false;
    }

    LOG_INFO("Worker claimed job: " + job->id);
    JobOutcome outcome = process(*job);

    // Terminal event is on disk; only now may the job leave the queue
    queue_.remove(job->id);

    processed_.fetch_add(1);
    if (outcome == JobOutcome::Failed) {
        failed_.fetch_add(1);
    }
    return true;
}

JobOutcome Worker::process(const Job& job) {
    auto startTime = std::chrono::steady_clock::now();

    log_.append("job.started", jobPayload(job),
                "JOB " + std::string(toString(job.type)) + " mode=" + toString(job.mode) +
                " repo=" + job.repo.value_or("-"));

    CollaboratorResult result;
    try {
        result = execute(job);
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& e) {
        result = CollaboratorResult{};
        result.error = e.what();
    } catch (...) {
        LOG_ERROR("Job " + job.id + " threw a non-standard exception");
        result = CollaboratorResult{};
        result.error = "unknown collaborator error";
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();

    auto payload = jobPayload(job);
    payload["duration_ms"] = elapsed;

    if (result.success) {
        log_.append("job.done", payload, "DONE " + job.id);
        LOG_INFO("JOB COMPLETED: " + job.id + " in " + std::to_string(elapsed) + "ms");
        return JobOutcome::Succeeded;
    }

    std::string error = result.error.empty() ? "collaborator reported failure" : result.error;
    payload["error"] = error;
    if (!result.output.empty()) {
        payload["output"] = outputTail(result.output);
    }
    log_.append("job.failed", payload, "FAILED " + job.id + ": " + error);
    LOG_WARN("Job failed: " + job.id + " - " + error);
    return JobOutcome::Failed;
}

CollaboratorResult Worker::execute(const Job& job) {
    switch (job.type) {
        case JobType::ScanChanged:
        case JobType::ScanAll:
            return scan(job);
        case JobType::PRSweep:
            return sweep(job);
    }
    CollaboratorResult unknown;
    unknown.error = "no handler for job type";
    return unknown;
}

CollaboratorResult Worker::scan(const Job& job) {
    ScanMode mode = job.type == JobType::ScanAll ? ScanMode::All : job.mode;

    CollaboratorResult result;
    auto repos = targetRepos(job);
    if (repos.empty()) {
        LOG_WARN("No target repos for job " + job.id + " (mode=" + toString(mode) + ")");
        result.success = true;
        result.output = "no target repos";
        return result;
    }

    std::vector<std::string> failures;
    for (const auto& repo : repos) {
        CollaboratorResult check;
        try {
            check = checks_.run(repo, mode);
        } catch (const std::exception& e) {
            check.error = e.what();
        }

        auto payload = jobPayload(job);
        payload["step"] = "check";
        payload["repo"] = repo;
        payload["success"] = check.success;
        if (!check.success) {
            payload["error"] = check.error;
        }
        log_.append("job.progress", payload, "CHECK " + repo + (check.success ? " ok" : " failed"));

        result.output += check.output;
        if (!check.success) {
            failures.push_back(repo + ": " + (check.error.empty() ? "check failed" : check.error));
            continue;
        }

        if (job.autoPr) {
            CollaboratorResult pr;
            try {
                pr = publisher_.publish({repo});
            } catch (const std::exception& e) {
                pr.error = e.what();
            }

            auto prPayload = jobPayload(job);
            prPayload["step"] = "pr";
            prPayload["repo"] = repo;
            prPayload["success"] = pr.success;
            if (!pr.success) {
                prPayload["error"] = pr.error;
            }
            log_.append("job.progress", prPayload, "PR " + repo + (pr.success ? " ok" : " failed"));

            result.output += pr.output;
            if (!pr.success) {
                failures.push_back(repo + " (pr): " + (pr.error.empty() ? "publish failed" : pr.error));
            }
        }
    }

    result.success = failures.empty();
    result.error = join(failures, "; ");
    return result;
}

CollaboratorResult Worker::sweep(const Job& job) {
    auto repos = targetRepos(job);
    if (repos.empty()) {
        LOG_WARN("No repositories configured for sweep " + job.id);
        CollaboratorResult result;
        result.success = true;
        result.output = "no target repos";
        return result;
    }

    CollaboratorResult result = publisher_.publish(repos);

    auto payload = jobPayload(job);
    payload["step"] = "sweep";
    payload["repos"] = repos;
    payload["success"] = result.success;
    log_.append("job.progress", payload,
                "SWEEP " + std::to_string(repos.size()) + " repo(s)" + (result.success ? " ok" : " failed"));
    return result;
}

std::vector<std::string> Worker::targetRepos(const Job& job) const {
    if (job.repo) {
        return {*job.repo};
    }
    return config_.repos;
}

void Worker::idle() {
    auto sleepEnd = std::chrono::steady_clock::now() + config_.idleInterval;
    while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

}

/*
 * sichter - Review Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sichter/queue.hpp"
#include "sichter/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace sichter {

namespace {
constexpr const char* kStages[] = {"processing", "ready", "writing"};
constexpr std::size_t kMaxRepoLength = 200;

bool syncDirectory(const std::filesystem::path& dir) noexcept {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

std::string jobFileName(const JobId& id) {
    return id + ".json";
}
}

Queue::Queue(const Config& config, bool createIfMissing)
    : root_(config.queueDir()), fsync_(config.fsync) {
    if (!createLayout(createIfMissing)) {
        LOG_ERROR("Failed to initialize queue: " + root_.string());
    }
}

SubmitResult Queue::submit(const JobSpec& spec) {
    Job job;
    std::string error;
    if (!validate(spec, job, error)) {
        LOG_DEBUG("Rejected submission: " + error);
        return {false, "", ErrorKind::Validation, error};
    }

    job.id = generateId(job.enqueuedAt);
    LOG_DEBUG("Generated job ID: " + job.id);

    std::string content;
    try {
        content = toJson(job).dump(2);
    } catch (const std::exception& e) {
        return {false, "", ErrorKind::Validation, std::string("Job is not serializable: ") + e.what()};
    }

    if (!writeDurable(root_ / "writing" / jobFileName(job.id), content)) {
        LOG_ERROR("Failed to write job file for: " + job.id);
        cleanupFailedJob(job.id);
        return {false, "", ErrorKind::Storage, "Failed to write job file"};
    }

    if (!atomicPublish(job.id)) {
        LOG_ERROR("Failed to publish job: " + job.id);
        cleanupFailedJob(job.id);
        return {false, "", ErrorKind::Storage, "Failed to publish job"};
    }

    LOG_INFO("Job submitted: " + job.id + " " + toString(job.type) + " mode=" + toString(job.mode) +
             (job.repo ? " repo=" + *job.repo : ""));
    return {true, job.id, ErrorKind::None, ""};
}

std::vector<Job> Queue::peekAll() const {
    std::vector<Job> jobs;
    // Jobs only move ready -> processing, so listing in that order sees a
    // concurrently claimed job at least once; duplicates are dropped below
    for (const char* stage : {"ready", "processing"}) {
        for (const auto& file : listJobs(stage)) {
            if (auto job = readJob(file)) {
                jobs.push_back(std::move(*job));
            }
        }
    }
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) { return a.id < b.id; });
    jobs.erase(std::unique(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) { return a.id == b.id; }),
               jobs.end());
    return jobs;
}

std::size_t Queue::size() const noexcept {
    try {
        std::size_t ready = listJobs("ready").size();
        return ready + listJobs("processing").size();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Cannot count queue: ") + e.what());
        return 0;
    }
}

std::optional<Job> Queue::claimNext() {
    std::lock_guard<std::mutex> lock(claimMutex_);

    if (!listJobs("processing").empty()) {
        LOG_TRACE("Claim already in flight");
        return std::nullopt;
    }

    for (const auto& file : listJobs("ready")) {
        auto target = root_ / "processing" / file.filename();

        std::error_code ec;
        std::filesystem::rename(file, target, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) {
                LOG_DEBUG("Job already claimed or missing: " + file.filename().string());
                continue;
            }
            throw StorageError("Cannot claim " + file.filename().string() + ": " + ec.message());
        }

        auto job = readJob(target);
        if (!job) {
            LOG_WARN("Unreadable job file moved aside: " + file.filename().string());
            quarantine(target);
            continue;
        }

        LOG_DEBUG("Job claimed: " + job->id);
        return job;
    }

    return std::nullopt;
}

void Queue::remove(const JobId& id) {
    if (id.empty() || id.find('/') != std::string::npos || id.find("..") != std::string::npos) {
        LOG_WARN("Ignoring remove of malformed job id: " + id);
        return;
    }

    for (const char* stage : kStages) {
        std::error_code ec;
        bool removed = std::filesystem::remove(root_ / stage / jobFileName(id), ec);
        if (ec) {
            throw StorageError("Failed to remove job " + id + ": " + ec.message());
        }
        if (removed) {
            LOG_DEBUG("Job removed from " + std::string(stage) + ": " + id);
        }
    }
}

std::size_t Queue::recover() noexcept {
    std::size_t recovered = 0;
    try {
        for (const auto& file : listJobs("processing")) {
            auto name = file.filename().string();
            LOG_WARN("Recovering orphaned job: " + name);

            std::error_code ec;
            std::filesystem::rename(file, root_ / "ready" / name, ec);
            if (ec) {
                LOG_ERROR("Failed to recover job " + name + ": " + ec.message());
                quarantine(file);
            } else {
                ++recovered;
            }
        }

        if (recovered > 0) {
            LOG_INFO("Recovered " + std::to_string(recovered) + " orphaned job(s)");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering orphaned jobs: " + std::string(e.what()));
    }
    return recovered;
}

bool Queue::isAvailable() const noexcept {
    std::error_code ec;
    return std::filesystem::is_directory(root_ / "ready", ec) &&
           std::filesystem::is_directory(root_ / "processing", ec) &&
           std::filesystem::is_directory(root_ / "writing", ec);
}

bool Queue::validate(const JobSpec& spec, Job& job, std::string& error) {
    auto type = parseJobType(spec.type);
    if (!type) {
        error = spec.type.empty() ? "Job type is required"
                                  : "Unknown job type: " + spec.type;
        return false;
    }

    auto mode = parseScanMode(spec.mode);
    if (!mode) {
        error = "Invalid mode: " + spec.mode + " (expected changed or all)";
        return false;
    }

    if (spec.repo && !spec.repo->empty() && !isValidRepo(*spec.repo)) {
        error = "Invalid repo name format: " + *spec.repo;
        return false;
    }

    job.type = *type;
    job.mode = *mode;
    job.repo = (spec.repo && !spec.repo->empty()) ? spec.repo : std::nullopt;
    job.autoPr = spec.autoPr;
    return true;
}

bool Queue::isValidRepo(const std::string& repo) noexcept {
    try {
        static const std::regex pattern("^[A-Za-z0-9_.-]+(/[A-Za-z0-9_.-]+)?$");
        if (repo.size() > kMaxRepoLength || !std::regex_match(repo, pattern)) {
            return false;
        }
        auto slash = repo.find('/');
        std::string owner = repo.substr(0, slash);
        std::string name = slash == std::string::npos ? "" : repo.substr(slash + 1);
        for (const auto& part : {owner, name}) {
            if (part == "." || part == "..") {
                return false;
            }
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool Queue::createLayout(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(root_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(root_);
        }

        for (const char* stage : kStages) {
            std::filesystem::create_directories(root_ / stage);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create queue layout: " + std::string(e.what()));
        return false;
    }
}

JobId Queue::generateId(Timestamp& issuedAt) {
    static std::atomic<std::int64_t> last{0};
    static std::atomic<std::uint64_t> counter{0};

    // Strictly increasing per process, so name order is submission order
    std::int64_t now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::int64_t prev = last.load();
    std::int64_t next = 0;
    do {
        next = std::max(now, prev + 1);
    } while (!last.compare_exchange_weak(prev, next));

    issuedAt = Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(next)));

    std::ostringstream ss;
    ss << std::setw(17) << std::setfill('0') << next << "_" << ::getpid() << "_" << counter.fetch_add(1);
    return ss.str();
}

std::vector<std::filesystem::path> Queue::listJobs(const char* stage) const {
    std::vector<std::filesystem::path> files;
    auto dir = root_ / stage;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw StorageError("Cannot read " + dir.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::optional<Job> Queue::readJob(const std::filesystem::path& file) const noexcept {
    try {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            LOG_DEBUG("Job file vanished: " + file.string());
            return std::nullopt;
        }
        auto value = nlohmann::json::parse(in, nullptr, false);
        if (value.is_discarded()) {
            LOG_WARN("Malformed job file: " + file.string());
            return std::nullopt;
        }
        auto job = jobFromJson(value);
        if (job) {
            job->id = file.stem().string();
        }
        return job;
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading job file " + file.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool Queue::writeDurable(const std::filesystem::path& file, const std::string& content) const noexcept {
    int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("Cannot open " + file.string() + ": " + std::strerror(errno));
        return false;
    }

    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Write failed for " + file.string() + ": " + std::strerror(errno));
            ::close(fd);
            return false;
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (fsync_ && ::fsync(fd) != 0) {
        LOG_ERROR("fsync failed for " + file.string() + ": " + std::strerror(errno));
        ::close(fd);
        return false;
    }
    return ::close(fd) == 0;
}

bool Queue::atomicPublish(const JobId& id) const noexcept {
    std::error_code ec;
    std::filesystem::rename(root_ / "writing" / jobFileName(id), root_ / "ready" / jobFileName(id), ec);
    if (ec) {
        LOG_ERROR("Publish rename failed for " + id + ": " + ec.message());
        return false;
    }
    if (fsync_ && !syncDirectory(root_ / "ready")) {
        LOG_WARN("Could not sync queue directory after publishing " + id);
    }
    return true;
}

void Queue::quarantine(const std::filesystem::path& file) const noexcept {
    std::error_code ec;
    std::filesystem::create_directories(root_ / "rejected", ec);
    std::filesystem::rename(file, root_ / "rejected" / file.filename(), ec);
    if (ec) {
        LOG_ERROR("Could not move aside " + file.string() + ": " + ec.message());
        std::filesystem::remove(file, ec);
    }
}

void Queue::cleanupFailedJob(const JobId& id) const noexcept {
    std::error_code ec;
    std::filesystem::remove(root_ / "writing" / jobFileName(id), ec);
}

nlohmann::json toJson(const Job& job) {
    nlohmann::json j;
    j["id"] = job.id;
    j["type"] = toString(job.type);
    j["mode"] = toString(job.mode);
    j["repo"] = job.repo ? nlohmann::json(*job.repo) : nlohmann::json(nullptr);
    j["auto_pr"] = job.autoPr;
    j["enqueued_at"] = formatTimestamp(job.enqueuedAt);
    return j;
}

std::optional<Job> jobFromJson(const nlohmann::json& value) noexcept {
    try {
        if (!value.is_object()) {
            return std::nullopt;
        }

        auto type = parseJobType(value.value("type", std::string()));
        auto mode = parseScanMode(value.value("mode", std::string("changed")));
        if (!type || !mode) {
            return std::nullopt;
        }

        Job job;
        job.id = value.value("id", std::string());
        job.type = *type;
        job.mode = *mode;
        if (auto it = value.find("repo"); it != value.end() && it->is_string()) {
            job.repo = it->get<std::string>();
        }
        job.autoPr = value.value("auto_pr", true);
        if (auto ts = parseTimestamp(value.value("enqueued_at", std::string()))) {
            job.enqueuedAt = *ts;
        }
        return job;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool jobSpecFromJson(const nlohmann::json& value, JobSpec& spec, std::string& error) {
    if (!value.is_object()) {
        error = "Payload must be a JSON object";
        return false;
    }

    auto stringField = [&](const char* name, std::string& out) {
        auto it = value.find(name);
        if (it == value.end() || it->is_null()) {
            return true;
        }
        if (!it->is_string()) {
            error = std::string("Field '") + name + "' must be a string";
            return false;
        }
        out = it->get<std::string>();
        return true;
    };

    if (!stringField("type", spec.type) || !stringField("mode", spec.mode)) {
        return false;
    }

    std::string repo;
    if (!stringField("repo", repo)) {
        return false;
    }
    if (!repo.empty()) {
        spec.repo = repo;
    }

    if (auto it = value.find("auto_pr"); it != value.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            error = "Field 'auto_pr' must be a boolean";
            return false;
        }
        spec.autoPr = it->get<bool>();
    }
    return true;
}

}

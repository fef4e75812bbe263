#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace sichter {

// Work the worker knows how to dispatch.
enum class JobType : std::uint8_t { ScanChanged, ScanAll, PRSweep };

enum class ScanMode : std::uint8_t { Changed, All };

// Failure classes shared by queue, worker, gateway and stream client.
enum class ErrorKind : std::uint8_t { None = 0, Validation, Collaborator, Transport, Storage };

// Opaque job identifier. Lexicographic order is submission order.
using JobId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

struct Job {
    JobId id;
    JobType type = JobType::ScanChanged;
    ScanMode mode = ScanMode::Changed;
    std::optional<std::string> repo;
    bool autoPr = true;
    Timestamp enqueuedAt{};
};

// Unvalidated submission as it arrives from a client.
struct JobSpec {
    std::string type;
    std::string mode = "changed";
    std::optional<std::string> repo;
    bool autoPr = true;
};

// Queue or event log storage is unusable; fatal to the worker loop.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] const char* toString(JobType type) noexcept;
[[nodiscard]] const char* toString(ScanMode mode) noexcept;
[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

[[nodiscard]] std::optional<JobType> parseJobType(const std::string& value) noexcept;
[[nodiscard]] std::optional<ScanMode> parseScanMode(const std::string& value) noexcept;

// ISO-8601 UTC with millisecond precision, e.g. 2025-03-01T12:00:00.250Z
[[nodiscard]] std::string formatTimestamp(Timestamp ts);
[[nodiscard]] std::optional<Timestamp> parseTimestamp(const std::string& value) noexcept;

} // namespace sichter

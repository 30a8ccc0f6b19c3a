#pragma once
#include <cstdint>
#include <string>

namespace snapmx {

constexpr const char* kVersion = "0.1.0";

enum class Platform : std::uint8_t { iOS, Android };

// Job lifecycle as reported in results.
enum class JobStatus : std::uint8_t { Pending, Running, Success, Failed, Cancelled };

// Internal state machine of a single job.
enum class JobPhase : std::uint8_t {
    Pending,
    Provisioning,
    Executing,
    Validating,
    Succeeded,
    Failed,
    Cancelled
};

enum class Orientation : std::uint8_t { Unspecified, Portrait, Landscape };

// Stable job key used by matrix exports ("job-<index>").
using JobKey = std::string;

const char* platformName(Platform platform) noexcept;       // "iOS" / "Android"
const char* platformSlug(Platform platform) noexcept;       // "ios" / "android"
const char* statusName(JobStatus status) noexcept;          // lowercase
const char* phaseName(JobPhase phase) noexcept;
const char* orientationName(Orientation orientation) noexcept;

[[nodiscard]] bool isTerminal(JobPhase phase) noexcept;

} // namespace snapmx

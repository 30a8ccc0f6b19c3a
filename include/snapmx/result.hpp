/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "snapmx/config.hpp"
#include "snapmx/errors.hpp"
#include "snapmx/types.hpp"

namespace snapmx {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct ScreenshotResult {
    std::string name;
    std::string language;
    std::filesystem::path path;
    Orientation orientation = Orientation::Unspecified;
    std::optional<Dimensions> dimensions;
    std::uintmax_t sizeBytes = 0;
    TimePoint capturedAt{};
    bool success = false;
    std::optional<std::string> error;
};

enum class ArtifactKind : uint8_t { PageSource, Screenshot, DeviceLogs };

const char* artifactKindName(ArtifactKind kind) noexcept;

struct FailureArtifact {
    ArtifactKind kind = ArtifactKind::PageSource;
    std::filesystem::path path;
    TimePoint capturedAt{};
    std::uintmax_t sizeBytes = 0;
};

// Outcome of one job. Written only by the JobExecutor running that job.
struct JobResult {
    std::size_t index = 0;
    JobKey key;
    Platform platform = Platform::iOS;
    std::string deviceName;
    std::string deviceFolder;
    std::string language;
    std::filesystem::path outputDir;

    JobStatus status = JobStatus::Pending;
    std::vector<JobPhase> phases{JobPhase::Pending};
    std::vector<ScreenshotResult> screenshots;
    std::vector<FailureArtifact> failureArtifacts;
    std::vector<std::string> warnings;
    TimePoint startedAt{};
    TimePoint finishedAt{};
    std::optional<std::string> error;
    std::optional<ErrorKind> errorKind;

    [[nodiscard]] bool reached(JobPhase phase) const noexcept;
    [[nodiscard]] std::chrono::milliseconds duration() const noexcept;
};

struct RunSummary {
    std::size_t totalJobs = 0;
    std::size_t successfulJobs = 0;
    std::size_t failedJobs = 0;
    std::size_t cancelledJobs = 0;
    std::size_t totalScreenshots = 0;
    std::size_t totalFailureArtifacts = 0;
    std::size_t platforms = 0;
    std::size_t devices = 0;
    std::size_t languages = 0;
};

struct EnvironmentInfo {
    std::string os;
    std::string host;
    std::string workingDirectory;
    std::string toolVersion;

    [[nodiscard]] static EnvironmentInfo current();
};

struct RunResult {
    std::string runId;
    TimePoint startedAt{};
    TimePoint finishedAt{};
    bool success = false;
    std::vector<JobResult> jobs;   // ordered by job index
    RunSummary summary;
    EnvironmentInfo environment;
    std::optional<std::string> error;

    [[nodiscard]] std::chrono::milliseconds duration() const noexcept;
};

[[nodiscard]] RunSummary summarize(const std::vector<JobResult>& jobs);
[[nodiscard]] bool allSucceeded(const std::vector<JobResult>& jobs) noexcept;

// 8 lowercase hex characters.
[[nodiscard]] std::string newRunId();
// ISO-8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.000Z
[[nodiscard]] std::string formatTimestamp(TimePoint time);

}

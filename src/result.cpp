/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/result.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>
#include <system_error>

#include <sys/utsname.h>
#include <unistd.h>

namespace snapmx {

const char* artifactKindName(ArtifactKind kind) noexcept {
    switch (kind) {
        case ArtifactKind::PageSource: return "page_source";
        case ArtifactKind::Screenshot: return "screenshot";
        case ArtifactKind::DeviceLogs: return "device_logs";
    }
    return "unknown";
}

bool JobResult::reached(JobPhase phase) const noexcept {
    return std::find(phases.begin(), phases.end(), phase) != phases.end();
}

std::chrono::milliseconds JobResult::duration() const noexcept {
    if (finishedAt < startedAt) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(finishedAt - startedAt);
}

std::chrono::milliseconds RunResult::duration() const noexcept {
    if (finishedAt < startedAt) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(finishedAt - startedAt);
}

EnvironmentInfo EnvironmentInfo::current() {
    EnvironmentInfo info;
    info.toolVersion = kVersion;

    struct utsname uts {};
    if (uname(&uts) == 0) {
        info.os = std::string(uts.sysname) + " " + uts.release + " " + uts.machine;
    }

    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) == 0) {
        info.host = host;
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        info.workingDirectory = cwd.string();
    }
    return info;
}

RunSummary summarize(const std::vector<JobResult>& jobs) {
    RunSummary summary;
    std::set<Platform> platforms;
    std::set<std::string> devices;
    std::set<std::string> languages;

    summary.totalJobs = jobs.size();
    for (const auto& job : jobs) {
        switch (job.status) {
            case JobStatus::Success: ++summary.successfulJobs; break;
            case JobStatus::Cancelled: ++summary.cancelledJobs; break;
            case JobStatus::Failed: ++summary.failedJobs; break;
            default: break;
        }
        summary.totalScreenshots += static_cast<std::size_t>(
            std::count_if(job.screenshots.begin(), job.screenshots.end(),
                          [](const ScreenshotResult& s) { return s.success; }));
        summary.totalFailureArtifacts += job.failureArtifacts.size();

        platforms.insert(job.platform);
        devices.insert(std::string(platformSlug(job.platform)) + "/" + job.deviceFolder);
        languages.insert(job.language);
    }
    summary.platforms = platforms.size();
    summary.devices = devices.size();
    summary.languages = languages.size();
    return summary;
}

bool allSucceeded(const std::vector<JobResult>& jobs) noexcept {
    return std::all_of(jobs.begin(), jobs.end(),
                       [](const JobResult& r) { return r.status == JobStatus::Success; });
}

std::string newRunId() {
    std::random_device device;
    std::mt19937 engine(device());
    std::uniform_int_distribution<std::uint32_t> dist;

    std::ostringstream ss;
    ss << std::hex << std::setw(8) << std::setfill('0') << dist(engine);
    return ss.str();
}

std::string formatTimestamp(TimePoint time) {
    auto seconds = Clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --seconds;
    }

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

}

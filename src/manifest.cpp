/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/manifest.hpp"
#include "snapmx/logger.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace snapmx {

namespace {

json optionalText(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::string seconds(std::chrono::milliseconds duration) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << static_cast<double>(duration.count()) / 1000.0;
    return ss.str();
}

bool writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return false;
    }
    out << text;
    return static_cast<bool>(out);
}

json screenshotJson(const ScreenshotResult& shot) {
    json j = {
        {"name", shot.name},
        {"language", shot.language},
        {"path", shot.path.string()},
        {"orientation", orientationName(shot.orientation)},
        {"timestamp", formatTimestamp(shot.capturedAt)},
        {"success", shot.success},
        {"file_size_bytes", shot.sizeBytes},
        {"error_message", optionalText(shot.error)}
    };
    if (shot.dimensions) {
        j["dimensions"] = {{"width", shot.dimensions->width}, {"height", shot.dimensions->height}};
    } else {
        j["dimensions"] = nullptr;
    }
    return j;
}

json jobJson(const JobResult& job) {
    json phases = json::array();
    for (auto phase : job.phases) {
        phases.push_back(phaseName(phase));
    }

    json screenshots = json::array();
    for (const auto& shot : job.screenshots) {
        screenshots.push_back(screenshotJson(shot));
    }

    json artifacts = json::array();
    for (const auto& artifact : job.failureArtifacts) {
        artifacts.push_back({
            {"type", artifactKindName(artifact.kind)},
            {"path", artifact.path.string()},
            {"timestamp", formatTimestamp(artifact.capturedAt)},
            {"file_size_bytes", artifact.sizeBytes}
        });
    }

    return {
        {"job_id", job.key},
        {"index", job.index},
        {"platform", platformSlug(job.platform)},
        {"device", job.deviceName},
        {"device_folder", job.deviceFolder},
        {"language", job.language},
        {"output_dir", job.outputDir.string()},
        {"start_time", formatTimestamp(job.startedAt)},
        {"end_time", formatTimestamp(job.finishedAt)},
        {"duration_ms", job.duration().count()},
        {"status", statusName(job.status)},
        {"success", job.status == JobStatus::Success},
        {"phases", phases},
        {"error_kind", job.errorKind ? json(errorKindName(*job.errorKind)) : json(nullptr)},
        {"error_message", optionalText(job.error)},
        {"warnings", job.warnings},
        {"screenshots", screenshots},
        {"failure_artifacts", artifacts}
    };
}

}

json ManifestWriter::toJson(const RunResult& result) {
    json jobs = json::array();
    for (const auto& job : result.jobs) {
        jobs.push_back(jobJson(job));
    }

    const auto& s = result.summary;
    return {
        {"run_id", result.runId},
        {"start_time", formatTimestamp(result.startedAt)},
        {"end_time", formatTimestamp(result.finishedAt)},
        {"duration_ms", result.duration().count()},
        {"success", result.success},
        {"environment", {
            {"operating_system", result.environment.os},
            {"hostname", result.environment.host},
            {"working_directory", result.environment.workingDirectory},
            {"snapmx_version", result.environment.toolVersion}
        }},
        {"summary", {
            {"total_jobs", s.totalJobs},
            {"successful_jobs", s.successfulJobs},
            {"failed_jobs", s.failedJobs},
            {"cancelled_jobs", s.cancelledJobs},
            {"total_screenshots", s.totalScreenshots},
            {"total_failure_artifacts", s.totalFailureArtifacts},
            {"platforms", s.platforms},
            {"devices", s.devices},
            {"languages", s.languages}
        }},
        {"jobs", jobs},
        {"error_message", optionalText(result.error)}
    };
}

std::string ManifestWriter::toSummary(const RunResult& result) {
    std::ostringstream out;
    const auto& s = result.summary;

    out << "snapmx Screenshot Run Summary\n";
    out << "=============================\n\n";
    out << "Run ID: " << result.runId << "\n";
    out << "Start Time: " << formatTimestamp(result.startedAt) << "\n";
    out << "End Time: " << formatTimestamp(result.finishedAt) << "\n";
    out << "Duration: " << seconds(result.duration()) << " seconds\n";
    out << "Overall Success: " << (result.success ? "yes" : "no") << "\n";
    if (result.error) {
        out << "Run Error: " << *result.error << "\n";
    }
    out << "\n";

    out << "Environment:\n";
    out << "  OS: " << result.environment.os << "\n";
    out << "  Host: " << result.environment.host << "\n";
    out << "  snapmx: " << result.environment.toolVersion << "\n\n";

    out << "Summary:\n";
    out << "  Total Jobs: " << s.totalJobs << "\n";
    out << "  Successful: " << s.successfulJobs << "\n";
    out << "  Failed: " << s.failedJobs << "\n";
    out << "  Cancelled: " << s.cancelledJobs << "\n";
    out << "  Screenshots: " << s.totalScreenshots << "\n";
    out << "  Failure Artifacts: " << s.totalFailureArtifacts << "\n\n";

    out << "Job Results:\n";
    for (const auto& job : result.jobs) {
        out << "  [" << statusName(job.status) << "] " << job.key << " "
            << platformName(job.platform) << " " << job.deviceFolder << " " << job.language
            << " (" << seconds(job.duration()) << "s)\n";
        if (job.error) {
            out << "    Error: " << *job.error << "\n";
        }
        if (!job.screenshots.empty()) {
            out << "    Screenshots: " << job.screenshots.size() << "\n";
            std::size_t shown = 0;
            for (const auto& shot : job.screenshots) {
                if (shown++ == 3) break;
                out << "      " << (shot.success ? "ok " : "err") << " " << shot.name << "\n";
            }
            if (job.screenshots.size() > 3) {
                out << "      ... and " << job.screenshots.size() - 3 << " more\n";
            }
        }
        if (!job.failureArtifacts.empty()) {
            out << "    Failure Artifacts: " << job.failureArtifacts.size() << "\n";
            for (const auto& artifact : job.failureArtifacts) {
                out << "      " << artifactKindName(artifact.kind) << ": "
                    << artifact.path.filename().string() << "\n";
            }
        }
        out << "\n";
    }

    std::size_t unsuccessful = s.failedJobs + s.cancelledJobs;
    if (unsuccessful > 0) {
        out << unsuccessful << " job(s) did not succeed:\n";
        for (const auto& job : result.jobs) {
            if (job.status != JobStatus::Success) {
                out << "  - " << job.key << " (" << statusName(job.status) << ")\n";
            }
        }
    } else if (s.totalJobs > 0) {
        out << "All jobs completed successfully.\n";
    }
    return out.str();
}

ManifestFiles ManifestWriter::write(const RunResult& result,
                                    const std::filesystem::path& outputDir) const noexcept {
    ManifestFiles files;
    try {
        std::filesystem::create_directories(outputDir);
        files.manifestPath = outputDir / kManifestFile;
        files.summaryPath = outputDir / kSummaryFile;

        if (!writeText(files.manifestPath, toJson(result).dump(2) + "\n")) {
            files.message = "Cannot write " + files.manifestPath.string();
            LOG_ERROR(files.message);
            return files;
        }
        LOG_INFO("Written run manifest: " + files.manifestPath.string());

        if (!writeText(files.summaryPath, toSummary(result))) {
            files.message = "Cannot write " + files.summaryPath.string();
            LOG_ERROR(files.message);
            return files;
        }
        LOG_INFO("Written run summary: " + files.summaryPath.string());

        files.ok = true;
    } catch (const std::exception& e) {
        files.message = "Manifest error: " + std::string(e.what());
        LOG_ERROR(files.message);
    }
    return files;
}

}

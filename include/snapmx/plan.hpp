/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "snapmx/artifacts.hpp"
#include "snapmx/config.hpp"
#include "snapmx/errors.hpp"
#include "snapmx/ports.hpp"
#include "snapmx/types.hpp"

namespace snapmx {

// One platform + device + language execution unit. Exactly one of
// iosDevice / androidDevice is set, matching platform.
struct RunJob {
    std::size_t index = 0;
    Platform platform = Platform::iOS;
    std::optional<IosDevice> iosDevice;
    std::optional<AndroidDevice> androidDevice;
    std::string language;
    LocaleMapping locale;
    std::vector<ScreenshotPlan> screenshots;
    std::filesystem::path outputDir;
    PortAllocation ports;
    std::optional<std::filesystem::path> appPath;

    [[nodiscard]] JobKey key() const;                     // "job-<index>"
    [[nodiscard]] const std::string& deviceName() const;
    [[nodiscard]] const std::string& deviceFolder() const;
    [[nodiscard]] const std::string& platformVersion() const;
    [[nodiscard]] const std::string& platformLocale() const;
    [[nodiscard]] std::string describe() const;          // "iOS/iPhone 15/en"
};

struct RunPlan {
    std::vector<RunJob> jobs;
    std::size_t totalPlatforms = 0;
    std::size_t totalDevices = 0;
    std::size_t totalLanguages = 0;
    std::size_t totalScreenshots = 0;
    double estimatedMinutes = 0.0;
    std::map<Platform, std::filesystem::path> artifactPaths;
};

// Allow-lists; an empty list keeps everything.
struct PlanFilters {
    std::vector<std::string> platforms;
    std::vector<std::string> devices;     // device name or folder
    std::vector<std::string> languages;
    std::vector<std::string> screenshots;
};

struct PlanOptions {
    std::filesystem::path outputRoot = "Screenshots";
    PlanFilters filters;
    std::optional<std::filesystem::path> iosAppOverride;
    std::optional<std::filesystem::path> androidAppOverride;
    bool requireArtifacts = true;   // dry runs (plan, matrix) turn this off
};

struct PlanResult {
    bool ok = false;
    RunPlan plan;
    PlanError error = PlanError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class RunPlanBuilder {
public:
    explicit RunPlanBuilder(const ArtifactResolver& resolver) noexcept;

    RunPlanBuilder(const RunPlanBuilder&) = delete;
    RunPlanBuilder& operator=(const RunPlanBuilder&) = delete;

    // Ports come from config.ports.
    [[nodiscard]] PlanResult build(const Config& config, const PlanOptions& options) const;
    [[nodiscard]] PlanResult build(const Config& config, const PlanOptions& options,
                                   const PortAllocator& allocator) const;

private:
    const ArtifactResolver& resolver_;
};

// Resolves artifacts through GlobArtifactResolver over config.build.
[[nodiscard]] PlanResult buildPlan(const Config& config, const PlanOptions& options);

// Human-readable dry-run listing grouped platform -> device -> language.
[[nodiscard]] std::string describePlan(const RunPlan& plan);

}

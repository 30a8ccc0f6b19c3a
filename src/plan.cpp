/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/plan.hpp"
#include "snapmx/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>

namespace snapmx {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool allowed(const std::vector<std::string>& filter, const std::string& value) {
    if (filter.empty()) {
        return true;
    }
    return std::any_of(filter.begin(), filter.end(),
                       [&](const std::string& f) { return equalsIgnoreCase(f, value); });
}

std::string joinOrAll(const std::vector<std::string>& values) {
    if (values.empty()) {
        return "all";
    }
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ",";
        out += v;
    }
    return out;
}

PlanResult failure(PlanError error, const std::string& message) {
    LOG_ERROR(std::string("Plan error (") + planErrorName(error) + "): " + message);
    return {false, {}, error, message};
}

// A device selected for planning, independent of platform.
struct DeviceEntry {
    std::optional<IosDevice> ios;
    std::optional<AndroidDevice> android;
    const std::string& name() const { return ios ? ios->name : android->name; }
    const std::string& folder() const { return ios ? ios->folder : android->folder; }
};

std::vector<DeviceEntry> devicesFor(const Config& config, Platform platform,
                                    const std::vector<std::string>& filter) {
    std::vector<DeviceEntry> out;
    if (platform == Platform::iOS) {
        for (const auto& d : config.iosDevices) {
            if (allowed(filter, d.name) || allowed(filter, d.folder)) {
                out.push_back({d, std::nullopt});
            }
        }
    } else {
        for (const auto& d : config.androidDevices) {
            if (allowed(filter, d.name) || allowed(filter, d.folder)) {
                out.push_back({std::nullopt, d});
            }
        }
    }
    return out;
}

}

JobKey RunJob::key() const {
    return "job-" + std::to_string(index);
}

const std::string& RunJob::deviceName() const {
    return platform == Platform::iOS ? iosDevice->name : androidDevice->name;
}

const std::string& RunJob::deviceFolder() const {
    return platform == Platform::iOS ? iosDevice->folder : androidDevice->folder;
}

const std::string& RunJob::platformVersion() const {
    return platform == Platform::iOS ? iosDevice->platformVersion : androidDevice->platformVersion;
}

const std::string& RunJob::platformLocale() const {
    return platform == Platform::iOS ? locale.ios : locale.android;
}

std::string RunJob::describe() const {
    return std::string(platformName(platform)) + "/" + deviceName() + "/" + language;
}

RunPlanBuilder::RunPlanBuilder(const ArtifactResolver& resolver) noexcept
    : resolver_(resolver) {}

PlanResult RunPlanBuilder::build(const Config& config, const PlanOptions& options) const {
    return build(config, options, PortAllocator(config.ports.basePort, config.ports.portOffset));
}

PlanResult RunPlanBuilder::build(const Config& config, const PlanOptions& options,
                                 const PortAllocator& allocator) const {
    const auto& filters = options.filters;
    LOG_INFO("Building run plan - platforms: " + joinOrAll(filters.platforms) +
             ", devices: " + joinOrAll(filters.devices) +
             ", languages: " + joinOrAll(filters.languages) +
             ", screenshots: " + joinOrAll(filters.screenshots));

    auto portCheck = allocator.validate();
    if (!portCheck) {
        return failure(PlanError::InvalidPorts, portCheck.message);
    }

    for (const auto& name : filters.platforms) {
        if (!equalsIgnoreCase(name, "ios") && !equalsIgnoreCase(name, "android")) {
            return failure(PlanError::InvalidFilter, "Unknown platform: " + name);
        }
    }

    std::vector<Platform> platforms;
    for (Platform p : {Platform::iOS, Platform::Android}) {
        if (allowed(filters.platforms, platformSlug(p))) {
            platforms.push_back(p);
        }
    }

    std::vector<std::string> languages;
    for (const auto& lang : config.languages) {
        if (allowed(filters.languages, lang)) {
            languages.push_back(lang);
        }
    }
    for (const auto& wanted : filters.languages) {
        if (std::none_of(config.languages.begin(), config.languages.end(),
                         [&](const std::string& l) { return equalsIgnoreCase(l, wanted); })) {
            LOG_WARN("Language filter '" + wanted + "' matches no configured language");
        }
    }

    for (const auto& lang : languages) {
        if (config.localeMapping.find(lang) == config.localeMapping.end()) {
            return failure(PlanError::MissingLocale, "No locale mapping for language: " + lang);
        }
    }

    std::vector<ScreenshotPlan> screenshots;
    for (const auto& shot : config.screenshots) {
        if (allowed(filters.screenshots, shot.name)) {
            screenshots.push_back(shot);
        }
    }

    RunPlan plan;
    std::set<std::string> devicesSeen;

    for (Platform platform : platforms) {
        auto devices = devicesFor(config, platform, filters.devices);
        if (devices.empty() || languages.empty()) {
            continue;
        }

        const auto& overridePath = platform == Platform::iOS ? options.iosAppOverride
                                                             : options.androidAppOverride;
        auto appPath = resolver_.resolveArtifact(platform, overridePath);
        if (appPath) {
            plan.artifactPaths[platform] = *appPath;
        } else if (options.requireArtifacts) {
            return failure(PlanError::ArtifactRequired,
                           std::string("No app artifact for ") + platformName(platform) +
                           "; build the app or pass an explicit app path");
        }

        for (const auto& device : devices) {
            devicesSeen.insert(std::string(platformSlug(platform)) + "/" + device.folder());
            for (const auto& lang : languages) {
                RunJob job;
                job.index = plan.jobs.size();
                job.platform = platform;
                job.iosDevice = device.ios;
                job.androidDevice = device.android;
                job.language = lang;
                job.locale = config.localeMapping.at(lang);
                job.screenshots = screenshots;
                job.outputDir = options.outputRoot / platformName(platform) / device.folder() / lang;
                job.appPath = appPath;

                auto ports = allocator.allocate(job.index);
                if (!ports) {
                    return failure(PlanError::InvalidPorts, ports.message);
                }
                job.ports = ports.allocation;

                LOG_DEBUG("Planned " + job.key() + ": " + job.describe());
                plan.jobs.push_back(std::move(job));
            }
        }
        ++plan.totalPlatforms;
    }

    if (plan.jobs.empty()) {
        return failure(PlanError::EmptyPlan, "No jobs match the given filters");
    }

    plan.totalDevices = devicesSeen.size();
    plan.totalLanguages = languages.size();
    plan.totalScreenshots = screenshots.size();
    plan.estimatedMinutes = static_cast<double>(plan.jobs.size()) * defaults::kMinutesPerJob;

    LOG_INFO("Built run plan: " + std::to_string(plan.jobs.size()) + " jobs across " +
             std::to_string(plan.totalPlatforms) + " platforms, " +
             std::to_string(plan.totalLanguages) + " languages");
    return {true, std::move(plan), PlanError::None, ""};
}

PlanResult buildPlan(const Config& config, const PlanOptions& options) {
    GlobArtifactResolver resolver(config.build);
    RunPlanBuilder builder(resolver);
    return builder.build(config, options);
}

std::string describePlan(const RunPlan& plan) {
    std::ostringstream out;
    out << "Run plan: " << plan.jobs.size() << " jobs, "
        << plan.totalPlatforms << " platforms, "
        << plan.totalDevices << " devices, "
        << plan.totalLanguages << " languages, "
        << plan.totalScreenshots << " screenshots per job\n";
    out << "Estimated duration: " << std::fixed << std::setprecision(1)
        << plan.estimatedMinutes << " minutes\n";

    for (const auto& [platform, path] : plan.artifactPaths) {
        out << platformName(platform) << " app: " << path.string() << "\n";
    }

    const RunJob* previous = nullptr;
    for (const auto& job : plan.jobs) {
        if (!previous || previous->platform != job.platform) {
            out << "\n" << platformName(job.platform) << "\n";
        }
        if (!previous || previous->platform != job.platform || previous->deviceFolder() != job.deviceFolder()) {
            out << "  " << job.deviceName() << " (" << job.deviceFolder() << ", "
                << job.platformVersion() << ")\n";
        }
        out << "    " << job.key() << "  " << job.language << " -> " << job.platformLocale()
            << "  " << job.screenshots.size() << " screenshots"
            << "  ports " << job.ports.automationPort << "/"
            << (job.platform == Platform::iOS ? job.ports.iosAuxPort : job.ports.androidAuxPort)
            << "\n";
        previous = &job;
    }

    if (!plan.jobs.empty()) {
        const auto& first = plan.jobs.front();
        std::string shot = first.screenshots.empty() ? "screen" : first.screenshots.front().name;
        out << "\nExample output: "
            << (first.outputDir / (shot + "_" + first.language + ".png")).string() << "\n";
    }
    return out.str();
}

}

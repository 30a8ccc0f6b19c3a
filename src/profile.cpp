/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/profile.hpp"
#include "snapmx/logger.hpp"
#include <utility>

namespace snapmx {

namespace {

std::optional<Dimensions> lookupSize(const std::map<std::string, DeviceSize>& sizes,
                                     const std::string& folder, Orientation orientation) {
    auto it = sizes.find(folder);
    if (it == sizes.end()) {
        return std::nullopt;
    }
    return orientation == Orientation::Landscape ? it->second.landscape : it->second.portrait;
}

std::vector<Selector> concat(const std::vector<Selector>& first, const std::vector<Selector>& second) {
    std::vector<Selector> out(first);
    out.insert(out.end(), second.begin(), second.end());
    return out;
}

}

// iOS

std::string IosProfile::deviceReference(const RunJob& job) const {
    return job.iosDevice->udid.value_or(job.iosDevice->name);
}

std::string IosProfile::provision(DeviceDriver& driver, const RunJob& job,
                                  std::chrono::milliseconds timeout,
                                  const DeviceBootedCallback& onBooted,
                                  const CancellationToken& token) const {
    const std::string ref = deviceReference(job);

    // Simulator locale only sticks while the simulator is shut down
    LOG_DEBUG("Setting locale " + job.locale.ios + " on " + ref);
    driver.setLocale(ref, job.locale.ios, token);
    token.throwIfCancelled();

    LOG_INFO("Booting simulator " + job.iosDevice->name);
    std::string deviceId = driver.boot(ref, timeout, token);
    onBooted(deviceId);
    return deviceId;
}

SessionCapabilities IosProfile::sessionCapabilities(const RunJob& job, const Config& config) const {
    const auto& typed = config.capabilities.ios;

    IosCapabilities caps;
    caps.deviceName = job.iosDevice->name;
    caps.platformVersion = job.iosDevice->platformVersion;
    caps.udid = deviceReference(job);
    if (job.appPath) caps.app = job.appPath->string();
    if (typed.automationName) caps.automationName = *typed.automationName;
    caps.wdaLocalPort = job.ports.iosAuxPort;
    caps.wdaLaunchTimeoutMs = typed.wdaLaunchTimeoutMs;
    caps.language = job.locale.ios;
    caps.locale = job.locale.ios;
    caps.extra = typed.extra;

    SessionCapabilities out;
    out.platform = Platform::iOS;
    out.automationPort = job.ports.automationPort;
    out.ios = std::move(caps);
    return out;
}

std::vector<Selector> IosProfile::dismissors(const ScreenshotPlan& plan, const Config& config) const {
    return concat(config.globalDismissorsIos, plan.dismissorsIos);
}

std::optional<Selector> IosProfile::assertion(const ScreenshotPlan& plan) const {
    return plan.assertIos;
}

std::optional<Dimensions> IosProfile::expectedSize(const Config& config, const RunJob& job,
                                                   Orientation orientation) const {
    if (!config.validation) {
        return std::nullopt;
    }
    return lookupSize(config.validation->expectedIos, job.deviceFolder(), orientation);
}

void IosProfile::teardown(DeviceDriver& driver, const RunJob& job,
                          const std::optional<std::string>& deviceId) const {
    driver.shutdown(deviceId.value_or(deviceReference(job)));
}

// Android

std::string AndroidProfile::deviceReference(const RunJob& job) const {
    return job.androidDevice->avd;
}

std::string AndroidProfile::provision(DeviceDriver& driver, const RunJob& job,
                                      std::chrono::milliseconds timeout,
                                      const DeviceBootedCallback& onBooted,
                                      const CancellationToken& token) const {
    LOG_INFO("Starting emulator " + job.androidDevice->avd);
    std::string serial = driver.boot(job.androidDevice->avd, timeout, token);
    onBooted(serial);
    token.throwIfCancelled();

    LOG_DEBUG("Setting locale " + job.locale.android + " on " + serial);
    driver.setLocale(serial, job.locale.android, token);
    return serial;
}

SessionCapabilities AndroidProfile::sessionCapabilities(const RunJob& job, const Config& config) const {
    const auto& typed = config.capabilities.android;

    AndroidCapabilities caps;
    caps.deviceName = job.androidDevice->name;
    caps.platformVersion = job.androidDevice->platformVersion;
    caps.avd = job.androidDevice->avd;
    if (job.appPath) caps.app = job.appPath->string();
    if (typed.automationName) caps.automationName = *typed.automationName;
    caps.appActivity = typed.appActivity;
    caps.systemPort = job.ports.androidAuxPort;
    if (typed.adbExecTimeoutMs) caps.adbExecTimeoutMs = *typed.adbExecTimeoutMs;
    caps.language = job.locale.android;
    caps.locale = job.locale.android;
    caps.extra = typed.extra;

    SessionCapabilities out;
    out.platform = Platform::Android;
    out.automationPort = job.ports.automationPort;
    out.android = std::move(caps);
    return out;
}

std::vector<Selector> AndroidProfile::dismissors(const ScreenshotPlan& plan, const Config& config) const {
    return concat(config.globalDismissorsAndroid, plan.dismissorsAndroid);
}

std::optional<Selector> AndroidProfile::assertion(const ScreenshotPlan& plan) const {
    return plan.assertAndroid;
}

std::optional<Dimensions> AndroidProfile::expectedSize(const Config& config, const RunJob& job,
                                                       Orientation orientation) const {
    if (!config.validation) {
        return std::nullopt;
    }
    return lookupSize(config.validation->expectedAndroid, job.deviceFolder(), orientation);
}

void AndroidProfile::teardown(DeviceDriver& driver, const RunJob& job,
                              const std::optional<std::string>& deviceId) const {
    driver.shutdown(deviceId.value_or(deviceReference(job)));
}

std::unique_ptr<PlatformProfile> makeProfile(Platform platform) {
    if (platform == Platform::iOS) {
        return std::make_unique<IosProfile>();
    }
    return std::make_unique<AndroidProfile>();
}

}

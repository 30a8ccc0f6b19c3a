/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "snapmx/cancel.hpp"
#include "snapmx/config.hpp"
#include "snapmx/drivers.hpp"
#include "snapmx/plan.hpp"

namespace snapmx {

struct IosCapabilities {
    std::string deviceName;
    std::string platformVersion;
    std::string udid;                  // udid if configured, else the simulator name
    std::optional<std::string> app;
    std::string automationName = "XCUITest";
    int wdaLocalPort = 0;
    std::optional<int> wdaLaunchTimeoutMs;
    std::string language;
    std::string locale;
    std::map<std::string, std::string> extra;
};

struct AndroidCapabilities {
    std::string deviceName;
    std::string platformVersion;
    std::string avd;
    std::optional<std::string> app;
    std::string automationName = "UiAutomator2";
    std::optional<std::string> appActivity;
    int systemPort = 0;
    int adbExecTimeoutMs = 60'000;
    std::string language;
    std::string locale;
    std::map<std::string, std::string> extra;
};

// Exactly one of ios / android is set, matching platform.
struct SessionCapabilities {
    Platform platform = Platform::iOS;
    int automationPort = 0;
    std::optional<IosCapabilities> ios;
    std::optional<AndroidCapabilities> android;
};

using DeviceBootedCallback = std::function<void(const std::string& deviceId)>;

// Platform-specific steps of a job, selected once per job.
class PlatformProfile {
public:
    virtual ~PlatformProfile() = default;

    [[nodiscard]] virtual Platform platform() const noexcept = 0;

    // The name the driver knows the device by before it has booted.
    [[nodiscard]] virtual std::string deviceReference(const RunJob& job) const = 0;

    // Boots and localizes the device. `onBooted` fires as soon as the device
    // is running so it can be registered before later steps can fail.
    virtual std::string provision(DeviceDriver& driver, const RunJob& job,
                                  std::chrono::milliseconds timeout,
                                  const DeviceBootedCallback& onBooted,
                                  const CancellationToken& token) const = 0;

    [[nodiscard]] virtual SessionCapabilities sessionCapabilities(const RunJob& job,
                                                                  const Config& config) const = 0;

    // Global dismissors first, then the plan's own.
    [[nodiscard]] virtual std::vector<Selector> dismissors(const ScreenshotPlan& plan,
                                                           const Config& config) const = 0;
    [[nodiscard]] virtual std::optional<Selector> assertion(const ScreenshotPlan& plan) const = 0;
    [[nodiscard]] virtual std::optional<Dimensions> expectedSize(const Config& config,
                                                                 const RunJob& job,
                                                                 Orientation orientation) const = 0;
    [[nodiscard]] virtual const PlatformBuild& build(const Config& config) const = 0;
    [[nodiscard]] virtual bool hasStatusBar(const Config& config) const noexcept = 0;

    // Shuts the device down by runtime id if known, else by reference.
    virtual void teardown(DeviceDriver& driver, const RunJob& job,
                          const std::optional<std::string>& deviceId) const = 0;
};

class IosProfile final : public PlatformProfile {
public:
    [[nodiscard]] Platform platform() const noexcept override { return Platform::iOS; }
    [[nodiscard]] std::string deviceReference(const RunJob& job) const override;
    std::string provision(DeviceDriver& driver, const RunJob& job,
                          std::chrono::milliseconds timeout,
                          const DeviceBootedCallback& onBooted,
                          const CancellationToken& token) const override;
    [[nodiscard]] SessionCapabilities sessionCapabilities(const RunJob& job, const Config& config) const override;
    [[nodiscard]] std::vector<Selector> dismissors(const ScreenshotPlan& plan, const Config& config) const override;
    [[nodiscard]] std::optional<Selector> assertion(const ScreenshotPlan& plan) const override;
    [[nodiscard]] std::optional<Dimensions> expectedSize(const Config& config, const RunJob& job,
                                                         Orientation orientation) const override;
    [[nodiscard]] const PlatformBuild& build(const Config& config) const override { return config.build.ios; }
    [[nodiscard]] bool hasStatusBar(const Config& config) const noexcept override { return config.statusBar.ios.has_value(); }
    void teardown(DeviceDriver& driver, const RunJob& job,
                  const std::optional<std::string>& deviceId) const override;
};

class AndroidProfile final : public PlatformProfile {
public:
    [[nodiscard]] Platform platform() const noexcept override { return Platform::Android; }
    [[nodiscard]] std::string deviceReference(const RunJob& job) const override;
    std::string provision(DeviceDriver& driver, const RunJob& job,
                          std::chrono::milliseconds timeout,
                          const DeviceBootedCallback& onBooted,
                          const CancellationToken& token) const override;
    [[nodiscard]] SessionCapabilities sessionCapabilities(const RunJob& job, const Config& config) const override;
    [[nodiscard]] std::vector<Selector> dismissors(const ScreenshotPlan& plan, const Config& config) const override;
    [[nodiscard]] std::optional<Selector> assertion(const ScreenshotPlan& plan) const override;
    [[nodiscard]] std::optional<Dimensions> expectedSize(const Config& config, const RunJob& job,
                                                         Orientation orientation) const override;
    [[nodiscard]] const PlatformBuild& build(const Config& config) const override { return config.build.android; }
    [[nodiscard]] bool hasStatusBar(const Config& config) const noexcept override { return config.statusBar.android.has_value(); }
    void teardown(DeviceDriver& driver, const RunJob& job,
                  const std::optional<std::string>& deviceId) const override;
};

[[nodiscard]] std::unique_ptr<PlatformProfile> makeProfile(Platform platform);

}

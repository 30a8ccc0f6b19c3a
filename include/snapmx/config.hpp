/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "snapmx/errors.hpp"
#include "snapmx/types.hpp"

namespace snapmx {

namespace defaults {
constexpr int kBasePort = 4723;
constexpr int kPortOffset = 10;
constexpr int kMinPort = 1024;
constexpr int kMaxPort = 65535;
constexpr int kMaxPortOffset = 100;
constexpr int kElementTimeoutMs = 10'000;
constexpr int kDismissorTimeoutMs = 2'000;
constexpr int kDismissDelayMs = 500;
constexpr int kSettleDelayMs = 1'000;
constexpr int kDeviceOperationTimeoutMs = 5 * 60 * 1000;
constexpr int kMaxTimeoutMs = 60 * 60 * 1000;
constexpr double kMaxWaitSeconds = 3600.0;
constexpr std::size_t kMaxDeviceLogBytes = 50'000;
constexpr const char* kLogTruncationMarker = "... (truncated) ...\n";
constexpr double kMinutesPerJob = 2.0;
}

struct IosDevice {
    std::string name;
    std::optional<std::string> udid;
    std::string folder;
    std::string platformVersion;
};

struct AndroidDevice {
    std::string name;
    std::string avd;
    std::string folder;
    std::string platformVersion;
};

struct LocaleMapping {
    std::string ios;
    std::string android;
};

struct Selector {
    std::optional<std::string> accessibilityId;
    std::optional<std::string> iosClassChain;
    std::optional<std::string> androidUiautomator;
    std::optional<std::string> xpath;
    std::optional<std::string> id;

    [[nodiscard]] bool empty() const noexcept {
        return !accessibilityId && !iosClassChain && !androidUiautomator && !xpath && !id;
    }
    [[nodiscard]] std::string describe() const;
};

enum class ActionType : uint8_t { Tap, Wait, WaitFor, Capture };

struct Action {
    ActionType type = ActionType::Wait;
    Selector selector;                 // Tap, WaitFor
    double seconds = 1.0;              // Wait
    std::optional<int> timeoutSeconds; // WaitFor
    std::string name;                  // Capture
};

struct ScreenshotPlan {
    std::string name;
    Orientation orientation = Orientation::Unspecified;
    std::vector<Action> actions;
    std::optional<Selector> assertIos;
    std::optional<Selector> assertAndroid;
    std::vector<Selector> dismissorsIos;
    std::vector<Selector> dismissorsAndroid;
};

struct PlatformBuild {
    std::optional<std::string> artifactGlob;
    std::optional<std::string> package;
};

struct BuildConfig {
    PlatformBuild ios;
    PlatformBuild android;
};

struct PortsConfig {
    int basePort = defaults::kBasePort;
    int portOffset = defaults::kPortOffset;
};

struct TimeoutsConfig {
    int elementMs = defaults::kElementTimeoutMs;
    int dismissorMs = defaults::kDismissorTimeoutMs;
    int dismissDelayMs = defaults::kDismissDelayMs;
    int settleMs = defaults::kSettleDelayMs;
    int deviceOperationMs = defaults::kDeviceOperationTimeoutMs;
};

enum class AppResetPolicy : uint8_t { Never, ClearOnLanguageChange, AlwaysReinstall };

struct FailureArtifactsConfig {
    bool savePageSource = true;
    bool saveScreenshot = true;
    bool saveDeviceLogs = true;
    std::optional<std::string> artifactsDir; // relative to the job output dir unless absolute
};

struct IosStatusBar {
    std::optional<std::string> time;
    std::optional<int> wifiBars;
    std::optional<int> cellularBars;
    std::optional<std::string> batteryState;
};

struct AndroidStatusBar {
    bool demoMode = true;
    std::optional<std::string> clock;
    std::optional<int> battery;
    std::optional<std::string> wifi;
    std::optional<std::string> notifications;
};

struct StatusBarConfig {
    std::optional<IosStatusBar> ios;
    std::optional<AndroidStatusBar> android;
};

struct Dimensions {
    int width = 0;
    int height = 0;

    bool operator==(const Dimensions& other) const noexcept {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Dimensions& other) const noexcept { return !(*this == other); }
};

struct DeviceSize {
    std::optional<Dimensions> portrait;
    std::optional<Dimensions> landscape;
};

struct ValidationConfig {
    bool enforceImageSize = false;
    std::map<std::string, DeviceSize> expectedIos;     // keyed by device folder
    std::map<std::string, DeviceSize> expectedAndroid;
};

// Typed capability fields per platform; provider-specific keys go to extra.
struct IosCapabilityConfig {
    std::optional<std::string> automationName;
    std::optional<int> wdaLaunchTimeoutMs;
    std::map<std::string, std::string> extra;
};

struct AndroidCapabilityConfig {
    std::optional<std::string> automationName;
    std::optional<std::string> appActivity;
    std::optional<int> adbExecTimeoutMs;
    std::map<std::string, std::string> extra;
};

struct CapabilitiesConfig {
    IosCapabilityConfig ios;
    AndroidCapabilityConfig android;
};

struct Config {
    std::vector<IosDevice> iosDevices;
    std::vector<AndroidDevice> androidDevices;
    std::vector<std::string> languages;
    std::map<std::string, LocaleMapping> localeMapping;
    std::vector<ScreenshotPlan> screenshots;

    BuildConfig build;
    PortsConfig ports;
    TimeoutsConfig timeouts;
    AppResetPolicy appReset = AppResetPolicy::Never;
    FailureArtifactsConfig failureArtifacts;
    StatusBarConfig statusBar;
    std::optional<ValidationConfig> validation;
    CapabilitiesConfig capabilities;
    std::vector<Selector> globalDismissorsIos;
    std::vector<Selector> globalDismissorsAndroid;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigErrorCode error = ConfigErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Structural validation only; semantic checks (locales, filters, ports)
// belong to planning.
[[nodiscard]] ConfigResult loadConfig(const std::filesystem::path& path);
[[nodiscard]] ConfigResult parseConfig(const std::string& text);

// Completeness checks for a loaded config: devices, languages, screenshots
// and a locale mapping for every language. Empty when the config is usable.
[[nodiscard]] std::vector<std::string> checkConfig(const Config& config);

// Device, language and screenshot counts for display.
[[nodiscard]] std::string describeConfig(const Config& config);

[[nodiscard]] std::optional<AppResetPolicy> parseResetPolicy(const std::string& text) noexcept;
[[nodiscard]] std::optional<Orientation> parseOrientation(const std::string& text) noexcept;

}

/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "snapmx/cancel.hpp"
#include "snapmx/config.hpp"
#include "snapmx/drivers.hpp"
#include "snapmx/plan.hpp"
#include "snapmx/profile.hpp"
#include "snapmx/registry.hpp"
#include "snapmx/result.hpp"

namespace snapmx {

// Collaborators for one job. The driver is the one for the job's platform.
struct JobServices {
    DeviceDriver& driver;
    SessionProvider& sessions;
    ImageInspector& images;
    ProcessRegistry& registry;
};

struct JobOptions {
    std::optional<std::filesystem::path> appOverride;
    bool skipInstall = false;
};

// Runs one RunJob through Provisioning -> Executing -> Validating and
// always tears down what it started. One instance per job, single use.
class JobExecutor {
public:
    JobExecutor(const RunJob& job, const Config& config, const PlatformProfile& profile,
                JobServices services, JobOptions options = {}) noexcept;
    ~JobExecutor() = default;

    JobExecutor(const JobExecutor&) = delete;
    JobExecutor& operator=(const JobExecutor&) = delete;
    JobExecutor(JobExecutor&&) = delete;
    JobExecutor& operator=(JobExecutor&&) = delete;

    // Never throws; every failure ends up in the returned JobResult.
    [[nodiscard]] JobResult execute(const CancellationToken& token) noexcept;

    [[nodiscard]] JobPhase phase() const noexcept { return phase_.load(); }

    // Failure artifacts land here: <outputDir>/failure_artifacts unless
    // failure_artifacts.artifacts_dir says otherwise.
    [[nodiscard]] std::filesystem::path artifactsDir() const;

private:
    void transition(JobPhase next);
    void fail(ErrorKind kind, const std::string& message, const CancellationToken& token) noexcept;

    void provision(const CancellationToken& token);
    void installApp(const CancellationToken& token);
    void applyResetPolicy(const CancellationToken& token);

    void runPlan(const ScreenshotPlan& plan, const CancellationToken& token);
    void runAction(const Action& action, const ScreenshotPlan& plan, const CancellationToken& token);
    void dismiss(const ScreenshotPlan& plan, const CancellationToken& token);
    void checkAssertion(const ScreenshotPlan& plan, const CancellationToken& token);
    void capture(const std::string& name, Orientation orientation);
    void validate();

    void captureFailureArtifacts() noexcept;
    void teardown() noexcept;

    AutomationSession& session();
    [[nodiscard]] std::optional<std::filesystem::path> appPath() const;

    const RunJob& job_;
    const Config& config_;
    const PlatformProfile& profile_;
    JobServices services_;
    JobOptions options_;

    JobResult result_;
    std::atomic<JobPhase> phase_{JobPhase::Pending};

    std::string serverKey_;
    std::string deviceKey_;
    bool serverAttempted_ = false;
    bool serverRegistered_ = false;
    bool bootAttempted_ = false;
    std::optional<std::string> deviceId_;
    bool deviceRegistered_ = false;
    std::unique_ptr<AutomationSession> session_;
    bool artifactsCaptured_ = false;
    bool tornDown_ = false;
};

// Keeps the newest `maxBytes` of a device log, prefixed with a marker when
// anything was dropped.
[[nodiscard]] std::string truncateLog(const std::string& log,
                                      std::size_t maxBytes = defaults::kMaxDeviceLogBytes);

}

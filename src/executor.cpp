/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/executor.hpp"
#include "snapmx/logger.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace snapmx {

namespace {

using std::chrono::milliseconds;

// Kind used when a plain std::exception escapes a collaborator.
ErrorKind kindForPhase(JobPhase phase) noexcept {
    switch (phase) {
        case JobPhase::Executing: return ErrorKind::Action;
        case JobPhase::Validating: return ErrorKind::Validation;
        default: return ErrorKind::Provisioning;
    }
}

std::string formatSeconds(milliseconds duration) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << static_cast<double>(duration.count()) / 1000.0;
    return ss.str();
}

std::uintmax_t writeFile(const std::filesystem::path& path, const void* data, std::size_t size) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out) {
        throw std::runtime_error("Write failed for " + path.string());
    }
    return size;
}

}

std::string truncateLog(const std::string& log, std::size_t maxBytes) {
    if (log.size() <= maxBytes) {
        return log;
    }
    return std::string(defaults::kLogTruncationMarker) + log.substr(log.size() - maxBytes);
}

JobExecutor::JobExecutor(const RunJob& job, const Config& config, const PlatformProfile& profile,
                         JobServices services, JobOptions options) noexcept
    : job_(job), config_(config), profile_(profile), services_(services),
      options_(std::move(options)) {}

std::filesystem::path JobExecutor::artifactsDir() const {
    const auto& configured = config_.failureArtifacts.artifactsDir;
    if (!configured) {
        return job_.outputDir / "failure_artifacts";
    }
    std::filesystem::path dir(*configured);
    if (dir.is_absolute()) {
        return dir / job_.key();
    }
    return job_.outputDir / dir;
}

JobResult JobExecutor::execute(const CancellationToken& token) noexcept {
    std::optional<JobLogScope> logScope;
    try {
        result_.index = job_.index;
        result_.key = job_.key();
        result_.platform = job_.platform;
        result_.deviceName = job_.deviceName();
        result_.deviceFolder = job_.deviceFolder();
        result_.language = job_.language;
        result_.outputDir = job_.outputDir;
        serverKey_ = result_.key + "/server";
        deviceKey_ = result_.key + "/device";
        logScope.emplace(result_.key);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot initialise job " + std::to_string(job_.index) + ": " + e.what());
        result_.status = JobStatus::Failed;
        result_.error = e.what();
        return result_;
    }

    result_.startedAt = Clock::now();
    result_.status = JobStatus::Running;
    LOG_INFO("Executing " + job_.describe());

    try {
        transition(JobPhase::Provisioning);
        provision(token);

        transition(JobPhase::Executing);
        for (const auto& plan : job_.screenshots) {
            token.throwIfCancelled();
            runPlan(plan, token);
        }

        transition(JobPhase::Validating);
        validate();

        transition(JobPhase::Succeeded);
        result_.status = JobStatus::Success;
    } catch (const JobError& e) {
        fail(e.kind(), e.what(), token);
    } catch (const std::exception& e) {
        fail(token.cancelled() ? ErrorKind::Cancelled : kindForPhase(phase_.load()), e.what(), token);
    }

    teardown();
    result_.finishedAt = Clock::now();

    const std::string seconds = formatSeconds(result_.duration());
    if (result_.status == JobStatus::Success) {
        LOG_INFO("Succeeded in " + seconds + "s (" +
                 std::to_string(result_.screenshots.size()) + " screenshots)");
    } else {
        LOG_ERROR(std::string("Finished ") + statusName(result_.status) + " after " + seconds + "s: " +
                  result_.error.value_or(""));
    }
    return result_;
}

void JobExecutor::transition(JobPhase next) {
    LOG_DEBUG(std::string(phaseName(phase_.load())) + " -> " + phaseName(next));
    phase_.store(next);
    result_.phases.push_back(next);
}

void JobExecutor::fail(ErrorKind kind, const std::string& message, const CancellationToken& token) noexcept {
    try {
        if (kind == ErrorKind::Cancelled || token.cancelled()) {
            result_.status = JobStatus::Cancelled;
            result_.errorKind = ErrorKind::Cancelled;
            result_.error = message.empty() ? "Operation cancelled" : message;
            transition(JobPhase::Cancelled);
            return;
        }

        result_.status = JobStatus::Failed;
        result_.errorKind = kind;
        result_.error = std::string(phaseName(phase_.load())) + " failed (" + errorKindName(kind) +
                        "): " + (message.empty() ? "unknown error" : message);
        LOG_ERROR(*result_.error);
        transition(JobPhase::Failed);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record job failure: " + std::string(e.what()));
        result_.status = JobStatus::Failed;
    }
    captureFailureArtifacts();
}

void JobExecutor::provision(const CancellationToken& token) {
    token.throwIfCancelled();
    const auto deviceTimeout = milliseconds(config_.timeouts.deviceOperationMs);
    const int port = job_.ports.automationPort;

    LOG_INFO("Starting automation server on port " + std::to_string(port));
    serverAttempted_ = true;
    services_.sessions.startServer(port, token);
    serverRegistered_ = services_.registry.registerResource(
        serverKey_, std::make_shared<ManagedAutomationServer>(services_.sessions, port));
    token.throwIfCancelled();

    auto onBooted = [this](const std::string& deviceId) {
        deviceId_ = deviceId;
        deviceRegistered_ = services_.registry.registerResource(
            deviceKey_, std::make_shared<ManagedDevice>(services_.driver, deviceId, job_.describe()));
    };
    bootAttempted_ = true;
    profile_.provision(services_.driver, job_, deviceTimeout, onBooted, token);
    if (!deviceId_) {
        throw ProvisioningError("Device " + job_.deviceName() + " reported no runtime id");
    }
    token.throwIfCancelled();

    installApp(token);

    if (profile_.hasStatusBar(config_)) {
        LOG_DEBUG("Applying status bar overrides");
        services_.driver.setStatusBar(*deviceId_, config_.statusBar, token);
    }

    applyResetPolicy(token);
    token.throwIfCancelled();

    auto capabilities = profile_.sessionCapabilities(job_, config_);
    if (auto app = appPath()) {
        if (capabilities.ios) capabilities.ios->app = app->string();
        if (capabilities.android) capabilities.android->app = app->string();
    }
    session_ = services_.sessions.createSession(job_, capabilities, token);
    if (!session_) {
        throw ProvisioningError("Automation session could not be created on port " + std::to_string(port));
    }
}

std::optional<std::filesystem::path> JobExecutor::appPath() const {
    if (options_.appOverride) {
        return options_.appOverride;
    }
    return job_.appPath;
}

void JobExecutor::installApp(const CancellationToken& token) {
    if (options_.skipInstall) {
        LOG_DEBUG("Skipping app install");
        return;
    }
    auto app = appPath();
    if (!app) {
        throw ProvisioningError(std::string("No app artifact for ") + platformName(job_.platform));
    }
    LOG_INFO("Installing " + app->string());
    services_.driver.installApp(*deviceId_, *app, token);
}

void JobExecutor::applyResetPolicy(const CancellationToken& token) {
    if (config_.appReset == AppResetPolicy::Never) {
        return;
    }

    const auto& package = profile_.build(config_).package;
    if (!package) {
        throw ProvisioningError(std::string("App reset needs build_config.") + platformSlug(job_.platform) +
                                ".package");
    }

    LOG_DEBUG("Clearing app data for " + *package);
    services_.driver.resetAppData(*deviceId_, *package, token);

    if (config_.appReset == AppResetPolicy::AlwaysReinstall && !options_.skipInstall) {
        token.throwIfCancelled();
        installApp(token);
    }
}

AutomationSession& JobExecutor::session() {
    if (!session_) {
        throw ActionError("No automation session");
    }
    return *session_;
}

void JobExecutor::runPlan(const ScreenshotPlan& plan, const CancellationToken& token) {
    LOG_DEBUG("Screenshot plan " + plan.name);

    if (plan.orientation != Orientation::Unspecified) {
        session().setOrientation(plan.orientation);
        if (token.waitFor(milliseconds(config_.timeouts.settleMs))) {
            throw CancelledError();
        }
    }

    dismiss(plan, token);

    for (const auto& action : plan.actions) {
        token.throwIfCancelled();
        runAction(action, plan, token);
    }

    checkAssertion(plan, token);
}

void JobExecutor::dismiss(const ScreenshotPlan& plan, const CancellationToken& token) {
    const auto timeout = milliseconds(config_.timeouts.dismissorMs);
    for (const auto& selector : profile_.dismissors(plan, config_)) {
        token.throwIfCancelled();
        try {
            auto element = session().findElement(selector, timeout, token);
            if (!element) {
                continue;
            }
            session().click(*element);
            LOG_DEBUG("Dismissed " + selector.describe());
            if (token.waitFor(milliseconds(config_.timeouts.dismissDelayMs))) {
                throw CancelledError();
            }
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            if (token.cancelled()) {
                throw CancelledError();
            }
            LOG_DEBUG("Dismissor " + selector.describe() + " skipped: " + e.what());
        }
    }
}

void JobExecutor::runAction(const Action& action, const ScreenshotPlan& plan, const CancellationToken& token) {
    switch (action.type) {
        case ActionType::Tap: {
            auto element = session().findElement(action.selector, milliseconds(config_.timeouts.elementMs), token);
            token.throwIfCancelled();
            if (!element) {
                throw ActionError("Element not found: " + action.selector.describe());
            }
            session().click(*element);
            break;
        }
        case ActionType::Wait: {
            auto delay = milliseconds(static_cast<long long>(action.seconds * 1000.0));
            if (token.waitFor(delay)) {
                throw CancelledError();
            }
            break;
        }
        case ActionType::WaitFor: {
            auto timeout = action.timeoutSeconds ? milliseconds(*action.timeoutSeconds * 1000LL)
                                                 : milliseconds(config_.timeouts.elementMs);
            bool present = session().waitFor(action.selector, timeout, token);
            token.throwIfCancelled();
            if (!present) {
                throw ActionError("Timed out after " + std::to_string(timeout.count()) +
                                  "ms waiting for " + action.selector.describe());
            }
            break;
        }
        case ActionType::Capture:
            capture(action.name, plan.orientation);
            break;
    }
}

void JobExecutor::checkAssertion(const ScreenshotPlan& plan, const CancellationToken& token) {
    auto selector = profile_.assertion(plan);
    if (!selector) {
        return;
    }
    auto element = session().findElement(*selector, milliseconds(config_.timeouts.elementMs), token);
    token.throwIfCancelled();
    if (!element) {
        std::string warning = "Assertion failed for " + plan.name + ": " + selector->describe() + " not found";
        LOG_WARN(warning);
        result_.warnings.push_back(warning);
    }
}

void JobExecutor::capture(const std::string& name, Orientation orientation) {
    ScreenshotResult shot;
    shot.name = name;
    shot.language = job_.language;
    shot.orientation = orientation;
    shot.path = job_.outputDir / (name + "_" + job_.language + ".png");
    shot.capturedAt = Clock::now();

    try {
        auto bytes = services_.driver.screenshot(*deviceId_);
        if (bytes.empty()) {
            throw ActionError("Device returned an empty screenshot");
        }
        shot.sizeBytes = writeFile(shot.path, bytes.data(), bytes.size());
        shot.success = true;
        LOG_INFO("Captured " + shot.path.string());
        result_.screenshots.push_back(std::move(shot));
    } catch (const std::exception& e) {
        shot.error = e.what();
        result_.screenshots.push_back(shot);
        throw ActionError("Capture of " + name + " failed: " + e.what());
    }
}

void JobExecutor::validate() {
    const bool enforce = config_.validation && config_.validation->enforceImageSize;

    for (auto& shot : result_.screenshots) {
        if (!shot.success) {
            continue;
        }
        shot.dimensions = services_.images.dimensions(shot.path);

        auto expected = profile_.expectedSize(config_, job_, shot.orientation);
        if (!expected) {
            continue;
        }
        if (!shot.dimensions) {
            std::string warning = "Could not read dimensions of " + shot.path.string();
            LOG_WARN(warning);
            result_.warnings.push_back(warning);
            continue;
        }
        if (*shot.dimensions != *expected) {
            std::string message = shot.name + " is " + std::to_string(shot.dimensions->width) + "x" +
                                  std::to_string(shot.dimensions->height) + ", expected " +
                                  std::to_string(expected->width) + "x" + std::to_string(expected->height);
            if (enforce) {
                shot.error = message;
                throw ValidationError(message);
            }
            LOG_WARN(message);
            result_.warnings.push_back(message);
        }
    }
}

void JobExecutor::captureFailureArtifacts() noexcept {
    if (artifactsCaptured_) {
        return;
    }
    artifactsCaptured_ = true;

    const auto& settings = config_.failureArtifacts;
    std::filesystem::path dir;
    try {
        dir = artifactsDir();
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("No artifacts directory: ") + e.what());
        return;
    }

    auto record = [this](ArtifactKind kind, const std::filesystem::path& path, std::uintmax_t size) {
        result_.failureArtifacts.push_back({kind, path, Clock::now(), size});
        LOG_INFO(std::string("Saved ") + artifactKindName(kind) + " to " + path.string());
    };

    if (settings.savePageSource && session_) {
        try {
            auto source = session_->pageSource();
            auto path = dir / "page_source.xml";
            record(ArtifactKind::PageSource, path, writeFile(path, source.data(), source.size()));
        } catch (const std::exception& e) {
            LOG_DEBUG(std::string("Page source not captured: ") + e.what());
        }
    }

    if (settings.saveScreenshot && deviceId_) {
        try {
            auto bytes = services_.driver.screenshot(*deviceId_);
            auto path = dir / "failure_screenshot.png";
            record(ArtifactKind::Screenshot, path, writeFile(path, bytes.data(), bytes.size()));
        } catch (const std::exception& e) {
            LOG_DEBUG(std::string("Failure screenshot not captured: ") + e.what());
        }
    }

    if (settings.saveDeviceLogs && deviceId_) {
        try {
            auto logs = truncateLog(services_.driver.deviceLogs(*deviceId_));
            auto path = dir / "device_logs.txt";
            record(ArtifactKind::DeviceLogs, path, writeFile(path, logs.data(), logs.size()));
        } catch (const std::exception& e) {
            LOG_DEBUG(std::string("Device logs not captured: ") + e.what());
        }
    }
}

void JobExecutor::teardown() noexcept {
    if (tornDown_) {
        return;
    }
    tornDown_ = true;
    LOG_DEBUG("Teardown");

    session_.reset();

    if (serverAttempted_) {
        try {
            auto server = services_.registry.unregisterResource(serverKey_);
            if (server) {
                server->stop();
            } else if (!serverRegistered_) {
                services_.sessions.stopServer(job_.ports.automationPort);
            }
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Teardown could not stop automation server: ") + e.what());
        }
    }

    // A registered device that is no longer in the registry was drained
    try {
        if (deviceRegistered_) {
            if (auto device = services_.registry.unregisterResource(deviceKey_)) {
                device->stop();
            }
        } else if (bootAttempted_) {
            profile_.teardown(services_.driver, job_, deviceId_);
        }
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Teardown could not shut down device: ") + e.what());
    }
}

}

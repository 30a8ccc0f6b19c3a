/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fakes.hpp"
#include "snapmx/executor.hpp"
#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>

using namespace snapmx;
using namespace snapmx::fakes;

namespace {

bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

std::size_t position(const std::vector<std::string>& items, const std::string& value) {
    return static_cast<std::size_t>(std::find(items.begin(), items.end(), value) - items.begin());
}

// One job with its own fakes; rebuild the plan after editing config.
class JobExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = makeConfig(1, 1, {"en"});
        sessions.script->present = {"start"};
    }

    RunJob job(std::size_t index = 0) {
        FakeArtifactResolver resolver;
        RunPlanBuilder builder(resolver);
        PlanOptions options;
        options.outputRoot = tmp.path() / "out";
        auto planned = builder.build(config, options);
        EXPECT_TRUE(planned) << planned.message;
        return planned.plan.jobs.at(index);
    }

    JobResult run(const RunJob& j, const CancellationToken& token = CancellationToken::none(),
                  JobOptions options = {}) {
        auto profile = makeProfile(j.platform);
        JobExecutor executor(j, config, *profile, JobServices{driver, sessions, images, registry},
                             std::move(options));
        return executor.execute(token);
    }

    TempDir tmp;
    Config config;
    FakeDeviceDriver driver;
    FakeSessionProvider sessions;
    FakeImageInspector images;
    ProcessRegistry registry;
};

}

TEST_F(JobExecutorTest, SuccessfulJobWalksEveryPhase) {
    auto j = job();
    auto result = run(j);

    EXPECT_EQ(result.status, JobStatus::Success);
    EXPECT_FALSE(result.error.has_value());
    std::vector<JobPhase> expected{JobPhase::Pending, JobPhase::Provisioning, JobPhase::Executing,
                                   JobPhase::Validating, JobPhase::Succeeded};
    EXPECT_EQ(result.phases, expected);
    EXPECT_EQ(result.key, "job-0");
    EXPECT_EQ(result.deviceFolder, "iphone15");
    EXPECT_GE(result.finishedAt, result.startedAt);
}

TEST_F(JobExecutorTest, CaptureWritesScreenshotIntoOutputDir) {
    auto j = job();
    auto result = run(j);
    ASSERT_EQ(result.status, JobStatus::Success);
    ASSERT_EQ(result.screenshots.size(), 1u);

    const auto& shot = result.screenshots[0];
    EXPECT_TRUE(shot.success);
    EXPECT_EQ(shot.path, j.outputDir / "home_en.png");
    EXPECT_TRUE(std::filesystem::exists(shot.path));
    EXPECT_EQ(shot.sizeBytes, driver.screenshotBytes.size());
    ASSERT_TRUE(shot.dimensions.has_value());
    EXPECT_EQ(shot.dimensions->width, 1290);
    EXPECT_EQ(sessions.script->clicks, std::vector<ElementId>{"start"});
}

TEST_F(JobExecutorTest, IosProvisioningSetsLocaleBeforeBootAndCleansUp) {
    auto result = run(job(0));
    ASSERT_EQ(result.status, JobStatus::Success);

    auto events = driver.eventLog();
    ASSERT_TRUE(contains(events, "locale:iPhone 15"));
    ASSERT_TRUE(contains(events, "boot:iPhone 15"));
    EXPECT_LT(position(events, "locale:iPhone 15"), position(events, "boot:iPhone 15"));
    EXPECT_TRUE(contains(events, "install:device-iPhone 15:App.app"));
    EXPECT_EQ(driver.locales, std::vector<std::string>{"en_US"});

    EXPECT_EQ(driver.shutdownCount(), 1);
    EXPECT_EQ(driver.shutdownIds, std::vector<std::string>{"device-iPhone 15"});
    EXPECT_EQ(sessions.stopCount(), 1u);
    EXPECT_TRUE(registry.empty());
}

TEST_F(JobExecutorTest, AndroidProvisioningBootsBeforeLocale) {
    auto result = run(job(1));
    ASSERT_EQ(result.status, JobStatus::Success) << result.error.value_or("");

    auto events = driver.eventLog();
    EXPECT_LT(position(events, "boot:Pixel_7_API_34"), position(events, "locale:device-Pixel_7_API_34"));
    EXPECT_EQ(driver.locales, std::vector<std::string>{"en-US"});
    EXPECT_EQ(driver.shutdownIds, std::vector<std::string>{"device-Pixel_7_API_34"});
}

TEST_F(JobExecutorTest, SessionCapabilitiesUseJobPorts) {
    auto j = job(1);
    auto result = run(j);
    ASSERT_EQ(result.status, JobStatus::Success);
    ASSERT_TRUE(sessions.lastCapabilities.has_value());

    const auto& caps = *sessions.lastCapabilities;
    EXPECT_EQ(caps.platform, Platform::Android);
    EXPECT_EQ(caps.automationPort, j.ports.automationPort);
    ASSERT_TRUE(caps.android.has_value());
    EXPECT_FALSE(caps.ios.has_value());
    EXPECT_EQ(caps.android->systemPort, j.ports.androidAuxPort);
    EXPECT_EQ(caps.android->avd, "Pixel_7_API_34");
    EXPECT_EQ(caps.android->app, std::string("/builds/app-release.apk"));
    EXPECT_EQ(sessions.startedPorts, std::vector<int>{j.ports.automationPort});
}

TEST_F(JobExecutorTest, BootFailureNeverReachesExecuting) {
    driver.failBoot = true;
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_FALSE(result.reached(JobPhase::Executing));
    EXPECT_TRUE(result.reached(JobPhase::Failed));
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("Provisioning failed (provisioning)"), std::string::npos);
    EXPECT_EQ(result.errorKind, ErrorKind::Provisioning);
    EXPECT_TRUE(result.screenshots.empty());

    // Never booted: shut down by simulator name
    EXPECT_EQ(driver.shutdownIds, std::vector<std::string>{"iPhone 15"});
    EXPECT_EQ(sessions.stopCount(), 1u);
    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(result.failureArtifacts.empty());
}

TEST_F(JobExecutorTest, ServerStartFailureSkipsDevice) {
    sessions.failStart = true;
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_EQ(result.errorKind, ErrorKind::Provisioning);
    EXPECT_EQ(driver.bootCalls, 0);
    EXPECT_EQ(driver.shutdownCount(), 0);
    EXPECT_EQ(sessions.stopCount(), 1u);
    EXPECT_TRUE(registry.empty());
}

TEST_F(JobExecutorTest, TeardownRunsExactlyOnceWhateverFails) {
    struct Scenario {
        const char* name;
        void (*arrange)(FakeDeviceDriver&, FakeSessionProvider&);
    };
    const Scenario scenarios[] = {
        {"locale", [](FakeDeviceDriver& d, FakeSessionProvider&) { d.failLocale = true; }},
        {"install", [](FakeDeviceDriver& d, FakeSessionProvider&) { d.failInstall = true; }},
        {"session", [](FakeDeviceDriver&, FakeSessionProvider& s) { s.failSession = true; }},
        {"tap", [](FakeDeviceDriver&, FakeSessionProvider& s) { s.script->present.clear(); }},
        {"capture", [](FakeDeviceDriver& d, FakeSessionProvider&) { d.failScreenshot = true; }},
    };

    for (const auto& scenario : scenarios) {
        SCOPED_TRACE(scenario.name);
        FakeDeviceDriver localDriver;
        FakeSessionProvider localSessions;
        localSessions.script->present = {"start"};
        ProcessRegistry localRegistry;
        scenario.arrange(localDriver, localSessions);

        auto j = job(1);
        AndroidProfile profile;
        JobExecutor executor(j, config, profile,
                             JobServices{localDriver, localSessions, images, localRegistry});
        auto result = executor.execute(CancellationToken::none());

        EXPECT_EQ(result.status, JobStatus::Failed);
        EXPECT_TRUE(result.error.has_value());
        EXPECT_EQ(localDriver.shutdownCount(), 1);
        EXPECT_EQ(localSessions.stopCount(), 1u);
        EXPECT_TRUE(localRegistry.empty());
        EXPECT_EQ(executor.phase(), JobPhase::Failed);
    }
}

TEST_F(JobExecutorTest, DeviceShutdownErrorKeepsSuccess) {
    driver.failShutdown = true;
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.phases.back(), JobPhase::Succeeded);
    EXPECT_EQ(driver.shutdownCount(), 1);
    EXPECT_EQ(sessions.stopCount(), 1u);
    EXPECT_TRUE(registry.empty());
}

TEST_F(JobExecutorTest, ServerStopErrorKeepsSuccess) {
    sessions.failStop = true;
    auto result = run(job(1));

    EXPECT_EQ(result.status, JobStatus::Success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.phases.back(), JobPhase::Succeeded);
    // Device teardown still runs after the server refused to stop
    EXPECT_EQ(driver.shutdownCount(), 1);
    EXPECT_EQ(sessions.stopCount(), 1u);
    EXPECT_TRUE(registry.empty());
}

TEST_F(JobExecutorTest, TeardownErrorsDoNotMaskJobFailure) {
    driver.failShutdown = true;
    sessions.failStop = true;
    sessions.script->present.clear();
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_EQ(result.errorKind, ErrorKind::Action);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("Executing failed (action)"), std::string::npos);
    EXPECT_TRUE(registry.empty());
}

TEST_F(JobExecutorTest, MissingElementFailsInExecuting) {
    sessions.script->present.clear();
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_EQ(result.errorKind, ErrorKind::Action);
    EXPECT_TRUE(result.reached(JobPhase::Executing));
    EXPECT_FALSE(result.reached(JobPhase::Validating));
    EXPECT_NE(result.error->find("Executing failed (action)"), std::string::npos);
    EXPECT_NE(result.error->find("start"), std::string::npos);
}

TEST_F(JobExecutorTest, WaitForTimeoutIsActionError) {
    config.screenshots[0].actions = {waitForAction("spinner-done", 0), captureAction("home")};
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_EQ(result.errorKind, ErrorKind::Action);
    EXPECT_NE(result.error->find("spinner-done"), std::string::npos);
    EXPECT_TRUE(result.screenshots.empty());
}

TEST_F(JobExecutorTest, WaitForPresentElementContinues) {
    sessions.script->present.insert("ready");
    config.screenshots[0].actions = {waitForAction("ready", 5), waitAction(0.01), captureAction("home")};
    auto result = run(job());
    EXPECT_EQ(result.status, JobStatus::Success);
    EXPECT_EQ(result.screenshots.size(), 1u);
}

TEST_F(JobExecutorTest, FailedCaptureIsRecordedThenFailsJob) {
    driver.failScreenshot = true;
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_EQ(result.errorKind, ErrorKind::Action);
    ASSERT_EQ(result.screenshots.size(), 1u);
    EXPECT_FALSE(result.screenshots[0].success);
    EXPECT_TRUE(result.screenshots[0].error.has_value());
}

TEST_F(JobExecutorTest, FailedAssertionWarnsAndContinues) {
    config.screenshots[0].assertIos = byId("welcome-title");
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("welcome-title"), std::string::npos);
    EXPECT_EQ(result.screenshots.size(), 1u);
}

TEST_F(JobExecutorTest, DismissorsRunBeforeActions) {
    sessions.script->present.insert("allow");
    config.globalDismissorsIos = {byId("allow"), byId("not-there")};
    auto result = run(job());

    ASSERT_EQ(result.status, JobStatus::Success);
    std::vector<ElementId> expected{"allow", "start"};
    EXPECT_EQ(sessions.script->clicks, expected);
}

TEST_F(JobExecutorTest, DismissorErrorsAreIgnored) {
    config.screenshots[0].dismissorsIos = {byId("allow")};
    config.screenshots[0].actions = {captureAction("home")};
    sessions.script->throwOnFind = true;
    auto result = run(job());
    EXPECT_EQ(result.status, JobStatus::Success);
}

TEST_F(JobExecutorTest, OrientationAppliedBeforePlan) {
    config.screenshots[0].orientation = Orientation::Landscape;
    auto result = run(job());

    ASSERT_EQ(result.status, JobStatus::Success);
    EXPECT_EQ(sessions.script->orientations, std::vector<Orientation>{Orientation::Landscape});
    EXPECT_EQ(result.screenshots[0].orientation, Orientation::Landscape);
}

TEST_F(JobExecutorTest, SizeMismatchWarnsWithoutEnforcement) {
    ValidationConfig validation;
    validation.expectedIos["iphone15"].portrait = Dimensions{1179, 2556};
    config.validation = validation;
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("1290x2796"), std::string::npos);
}

TEST_F(JobExecutorTest, SizeMismatchFailsWhenEnforced) {
    ValidationConfig validation;
    validation.enforceImageSize = true;
    validation.expectedIos["iphone15"].portrait = Dimensions{1179, 2556};
    config.validation = validation;
    auto result = run(job());

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_EQ(result.errorKind, ErrorKind::Validation);
    EXPECT_TRUE(result.reached(JobPhase::Validating));
    EXPECT_NE(result.error->find("Validating failed (validation)"), std::string::npos);
}

TEST_F(JobExecutorTest, MatchingSizePasses) {
    ValidationConfig validation;
    validation.enforceImageSize = true;
    validation.expectedIos["iphone15"].portrait = Dimensions{1290, 2796};
    config.validation = validation;
    auto result = run(job());
    EXPECT_EQ(result.status, JobStatus::Success);
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(JobExecutorTest, FailureArtifactsWrittenOnce) {
    driver.logs = std::string(60'000, 'x');
    sessions.script->present.clear();
    auto j = job();
    auto result = run(j);

    ASSERT_EQ(result.status, JobStatus::Failed);
    ASSERT_EQ(result.failureArtifacts.size(), 3u);

    auto dir = j.outputDir / "failure_artifacts";
    EXPECT_TRUE(std::filesystem::exists(dir / "page_source.xml"));
    EXPECT_TRUE(std::filesystem::exists(dir / "failure_screenshot.png"));
    EXPECT_TRUE(std::filesystem::exists(dir / "device_logs.txt"));

    auto logSize = std::filesystem::file_size(dir / "device_logs.txt");
    EXPECT_EQ(logSize, defaults::kMaxDeviceLogBytes + std::string(defaults::kLogTruncationMarker).size());
}

TEST_F(JobExecutorTest, NoPageSourceWithoutSession) {
    driver.failInstall = true;
    auto result = run(job());

    ASSERT_EQ(result.status, JobStatus::Failed);
    for (const auto& artifact : result.failureArtifacts) {
        EXPECT_NE(artifact.kind, ArtifactKind::PageSource);
    }
    EXPECT_EQ(result.failureArtifacts.size(), 2u);
}

TEST_F(JobExecutorTest, DisabledArtifactsAreSkipped) {
    config.failureArtifacts.savePageSource = false;
    config.failureArtifacts.saveDeviceLogs = false;
    sessions.script->present.clear();
    auto result = run(job());

    ASSERT_EQ(result.failureArtifacts.size(), 1u);
    EXPECT_EQ(result.failureArtifacts[0].kind, ArtifactKind::Screenshot);
}

TEST_F(JobExecutorTest, ArtifactsDirectoryResolution) {
    auto j = job();
    IosProfile profile;
    JobServices services{driver, sessions, images, registry};

    EXPECT_EQ(JobExecutor(j, config, profile, services).artifactsDir(), j.outputDir / "failure_artifacts");

    config.failureArtifacts.artifactsDir = "debug";
    EXPECT_EQ(JobExecutor(j, config, profile, services).artifactsDir(), j.outputDir / "debug");

    auto absolute = tmp.path() / "artifacts";
    config.failureArtifacts.artifactsDir = absolute.string();
    EXPECT_EQ(JobExecutor(j, config, profile, services).artifactsDir(), absolute / "job-0");
}

TEST_F(JobExecutorTest, ResetPolicyNeverLeavesAppAlone) {
    config.build.ios.package = "com.example.demo";
    auto result = run(job());
    ASSERT_EQ(result.status, JobStatus::Success);
    EXPECT_EQ(driver.resetCalls, 0);
    EXPECT_EQ(driver.installCalls, 1);
}

TEST_F(JobExecutorTest, ResetPolicyClearsDataOnLanguageChange) {
    config.appReset = AppResetPolicy::ClearOnLanguageChange;
    config.build.ios.package = "com.example.demo";
    auto result = run(job());
    ASSERT_EQ(result.status, JobStatus::Success);
    EXPECT_EQ(driver.resetCalls, 1);
    EXPECT_EQ(driver.installCalls, 1);
    EXPECT_TRUE(contains(driver.eventLog(), "reset:device-iPhone 15:com.example.demo"));
}

TEST_F(JobExecutorTest, ResetPolicyAlwaysReinstalls) {
    config.appReset = AppResetPolicy::AlwaysReinstall;
    config.build.ios.package = "com.example.demo";
    auto result = run(job());
    ASSERT_EQ(result.status, JobStatus::Success);
    EXPECT_EQ(driver.resetCalls, 1);
    EXPECT_EQ(driver.installCalls, 2);
}

TEST_F(JobExecutorTest, ResetWithoutPackageFailsProvisioning) {
    config.appReset = AppResetPolicy::ClearOnLanguageChange;
    auto result = run(job());
    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_EQ(result.errorKind, ErrorKind::Provisioning);
    EXPECT_FALSE(result.reached(JobPhase::Executing));
    EXPECT_EQ(driver.shutdownCount(), 1);
}

TEST_F(JobExecutorTest, StatusBarOnlyWhenConfigured) {
    auto plain = run(job());
    ASSERT_EQ(plain.status, JobStatus::Success);
    EXPECT_EQ(driver.statusBarCalls, 0);

    config.statusBar.ios = IosStatusBar{std::string("9:41"), 3, 4, std::string("charged")};
    auto styled = run(job());
    ASSERT_EQ(styled.status, JobStatus::Success);
    EXPECT_EQ(driver.statusBarCalls, 1);
}

TEST_F(JobExecutorTest, SkipInstallAndMissingApp) {
    auto j = job();
    j.appPath.reset();

    auto failed = run(j);
    EXPECT_EQ(failed.status, JobStatus::Failed);
    EXPECT_EQ(failed.errorKind, ErrorKind::Provisioning);

    JobOptions skip;
    skip.skipInstall = true;
    auto skipped = run(j, CancellationToken::none(), skip);
    EXPECT_EQ(skipped.status, JobStatus::Success);
    EXPECT_EQ(driver.installCalls, 0);
}

TEST_F(JobExecutorTest, AppOverrideWinsOverPlannedArtifact) {
    JobOptions options;
    options.appOverride = std::filesystem::path("/tmp/Hotfix.app");
    auto result = run(job(), CancellationToken::none(), options);
    ASSERT_EQ(result.status, JobStatus::Success);
    EXPECT_TRUE(contains(driver.eventLog(), "install:device-iPhone 15:Hotfix.app"));
    EXPECT_EQ(sessions.lastCapabilities->ios->app, std::string("/tmp/Hotfix.app"));
}

TEST_F(JobExecutorTest, CancelledBeforeStartTouchesNothing) {
    CancellationSource source;
    source.cancel();
    auto result = run(job(), source.token());

    EXPECT_EQ(result.status, JobStatus::Cancelled);
    EXPECT_EQ(result.errorKind, ErrorKind::Cancelled);
    EXPECT_TRUE(result.reached(JobPhase::Cancelled));
    EXPECT_EQ(driver.bootCalls, 0);
    EXPECT_EQ(driver.shutdownCount(), 0);
    EXPECT_TRUE(sessions.startedPorts.empty());
    EXPECT_TRUE(result.failureArtifacts.empty());
}

TEST_F(JobExecutorTest, CancelDuringBootStopsPromptly) {
    driver.bootDelay = std::chrono::milliseconds(10'000);
    CancellationSource source;

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    auto result = run(job(), source.token());
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_EQ(result.status, JobStatus::Cancelled);
    EXPECT_FALSE(result.reached(JobPhase::Failed));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(driver.shutdownCount(), 1);
    EXPECT_EQ(sessions.stopCount(), 1u);
    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(result.failureArtifacts.empty());
}

TEST_F(JobExecutorTest, CancelDuringWaitAction) {
    config.screenshots[0].actions = {waitAction(10.0), captureAction("home")};
    CancellationSource source;

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.cancel();
    });
    auto result = run(job(), source.token());
    canceller.join();

    EXPECT_EQ(result.status, JobStatus::Cancelled);
    EXPECT_TRUE(result.reached(JobPhase::Executing));
    EXPECT_TRUE(result.screenshots.empty());
    EXPECT_EQ(driver.shutdownCount(), 1);
    EXPECT_TRUE(registry.empty());
}

TEST_F(JobExecutorTest, DrainedDeviceIsNotStoppedTwice) {
    // Registry drained from elsewhere while the job is waiting
    config.screenshots[0].actions = {waitAction(0.5), captureAction("home")};
    std::thread drainer([this] {
        for (int i = 0; i < 1000 && registry.size() < 2; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        auto report = registry.drain();
        EXPECT_EQ(report.stopped, 2u);
    });
    auto result = run(job());
    drainer.join();

    EXPECT_EQ(driver.shutdownCount(), 1);
    EXPECT_EQ(sessions.stopCount(), 1u);
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(result.status, JobStatus::Success);
}

TEST(TruncateLogTest, ShortLogUnchanged) {
    EXPECT_EQ(truncateLog("abc", 10), "abc");
    EXPECT_EQ(truncateLog("", 10), "");
}

TEST(TruncateLogTest, KeepsNewestBytesWithMarker) {
    std::string log = "old-line\nnew-line\n";
    auto truncated = truncateLog(log, 9);
    EXPECT_EQ(truncated, std::string(defaults::kLogTruncationMarker) + "new-line\n");
}

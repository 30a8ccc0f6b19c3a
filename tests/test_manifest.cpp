/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fakes.hpp"
#include "snapmx/manifest.hpp"
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace snapmx;
using namespace snapmx::fakes;

namespace {

JobResult makeJob(std::size_t index, JobStatus status, std::size_t shots) {
    JobResult job;
    job.index = index;
    job.key = "job-" + std::to_string(index);
    job.platform = index % 2 == 0 ? Platform::iOS : Platform::Android;
    job.deviceName = job.platform == Platform::iOS ? "iPhone 15" : "Pixel 7";
    job.deviceFolder = job.platform == Platform::iOS ? "iphone15" : "pixel7";
    job.language = "en";
    job.outputDir = "/out/" + job.deviceFolder + "/en";
    job.status = status;
    job.startedAt = Clock::now();
    job.finishedAt = job.startedAt + std::chrono::milliseconds(1500);
    for (std::size_t i = 0; i < shots; ++i) {
        ScreenshotResult shot;
        shot.name = "screen" + std::to_string(i);
        shot.language = "en";
        shot.path = job.outputDir / (shot.name + "_en.png");
        shot.success = true;
        shot.sizeBytes = 1024;
        shot.dimensions = Dimensions{1290, 2796};
        job.screenshots.push_back(shot);
    }
    if (status == JobStatus::Failed) {
        job.phases = {JobPhase::Pending, JobPhase::Provisioning, JobPhase::Failed};
        job.errorKind = ErrorKind::Provisioning;
        job.error = "Provisioning failed (provisioning): boot failed";
        job.failureArtifacts.push_back({ArtifactKind::DeviceLogs, job.outputDir / "failure_artifacts" / "device_logs.txt",
                                        job.finishedAt, 42});
    }
    return job;
}

RunResult makeRun(std::vector<JobResult> jobs) {
    RunResult run;
    run.runId = "0badcafe";
    run.startedAt = Clock::now();
    run.finishedAt = run.startedAt + std::chrono::seconds(3);
    run.jobs = std::move(jobs);
    run.summary = summarize(run.jobs);
    run.success = allSucceeded(run.jobs);
    run.environment = EnvironmentInfo::current();
    return run;
}

}

TEST(ManifestTest, JsonCarriesRunAndJobs) {
    auto run = makeRun({makeJob(0, JobStatus::Success, 2), makeJob(1, JobStatus::Failed, 0)});
    auto j = ManifestWriter::toJson(run);

    EXPECT_EQ(j["run_id"], "0badcafe");
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["duration_ms"], 3000);
    EXPECT_EQ(j["environment"]["snapmx_version"], kVersion);
    EXPECT_EQ(j["summary"]["total_jobs"], 2);
    EXPECT_EQ(j["summary"]["failed_jobs"], 1);
    EXPECT_EQ(j["summary"]["total_screenshots"], 2);
    EXPECT_TRUE(j["error_message"].is_null());

    const auto& ok = j["jobs"][0];
    EXPECT_EQ(ok["job_id"], "job-0");
    EXPECT_EQ(ok["platform"], "ios");
    EXPECT_EQ(ok["status"], "success");
    EXPECT_EQ(ok["success"], true);
    EXPECT_TRUE(ok["error_kind"].is_null());
    ASSERT_EQ(ok["screenshots"].size(), 2u);
    EXPECT_EQ(ok["screenshots"][0]["dimensions"]["width"], 1290);
    EXPECT_EQ(ok["screenshots"][0]["file_size_bytes"], 1024);

    const auto& failed = j["jobs"][1];
    EXPECT_EQ(failed["status"], "failed");
    EXPECT_EQ(failed["error_kind"], "provisioning");
    EXPECT_EQ(failed["phases"].back(), "Failed");
    ASSERT_EQ(failed["failure_artifacts"].size(), 1u);
    EXPECT_EQ(failed["failure_artifacts"][0]["type"], "device_logs");
    EXPECT_EQ(failed["failure_artifacts"][0]["file_size_bytes"], 42);
}

TEST(ManifestTest, TimestampsAreUtcWithMilliseconds) {
    TimePoint epoch{};
    EXPECT_EQ(formatTimestamp(epoch + std::chrono::milliseconds(1'234)), "1970-01-01T00:00:01.234Z");
}

TEST(ManifestTest, SummaryListsJobsAndFailures) {
    auto run = makeRun({makeJob(0, JobStatus::Success, 5), makeJob(1, JobStatus::Failed, 0)});
    run.error = std::string("Run cancelled");
    auto text = ManifestWriter::toSummary(run);

    EXPECT_EQ(text.rfind("snapmx Screenshot Run Summary", 0), 0u);
    EXPECT_NE(text.find("Run ID: 0badcafe"), std::string::npos);
    EXPECT_NE(text.find("Run Error: Run cancelled"), std::string::npos);
    EXPECT_NE(text.find("[success] job-0 iOS iphone15 en (1.5s)"), std::string::npos);
    EXPECT_NE(text.find("... and 2 more"), std::string::npos);
    EXPECT_NE(text.find("1 job(s) did not succeed:"), std::string::npos);
    EXPECT_NE(text.find("  - job-1 (failed)"), std::string::npos);
    EXPECT_EQ(text.find("All jobs completed successfully."), std::string::npos);
}

TEST(ManifestTest, SummaryForCleanRun) {
    auto text = ManifestWriter::toSummary(makeRun({makeJob(0, JobStatus::Success, 1)}));
    EXPECT_NE(text.find("All jobs completed successfully."), std::string::npos);
    EXPECT_EQ(text.find("did not succeed"), std::string::npos);
}

TEST(ManifestTest, WritesBothFiles) {
    TempDir dir;
    auto run = makeRun({makeJob(0, JobStatus::Success, 1)});
    auto files = ManifestWriter().write(run, dir.path() / "Screenshots");
    ASSERT_TRUE(files) << files.message;

    ASSERT_TRUE(std::filesystem::exists(files.manifestPath));
    ASSERT_TRUE(std::filesystem::exists(files.summaryPath));
    EXPECT_EQ(files.manifestPath.filename(), "run_manifest.json");

    std::ifstream in(files.manifestPath);
    auto parsed = nlohmann::json::parse(in);
    EXPECT_EQ(parsed["run_id"], "0badcafe");
    EXPECT_EQ(parsed["jobs"].size(), 1u);
}

TEST(ManifestTest, WriteFailureIsReported) {
    TempDir dir;
    auto blocker = dir.path() / "not-a-dir";
    std::ofstream(blocker) << "x";

    auto files = ManifestWriter().write(makeRun({}), blocker / "nested");
    EXPECT_FALSE(files);
    EXPECT_FALSE(files.message.empty());
}

/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fakes.hpp"
#include "snapmx/matrix.hpp"
#include <gtest/gtest.h>

using namespace snapmx;
using namespace snapmx::fakes;

namespace {

RunPlan samplePlan() {
    FakeArtifactResolver resolver;
    RunPlanBuilder builder(resolver);
    PlanOptions options;
    options.outputRoot = "shots";
    auto planned = builder.build(makeConfig(1, 1, {"en", "de"}), options);
    EXPECT_TRUE(planned);
    return planned.plan;
}

}

TEST(MatrixTest, RecordsMirrorPlanOrder) {
    auto plan = samplePlan();
    auto records = matrixRecords(plan);
    ASSERT_EQ(records.size(), plan.jobs.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].id, plan.jobs[i].key());
        EXPECT_EQ(records[i].index, i);
        EXPECT_EQ(records[i].ports.automationPort, plan.jobs[i].ports.automationPort);
    }
    EXPECT_EQ(records[0].platform, "ios");
    EXPECT_EQ(records[0].device, "iPhone 15");
    EXPECT_EQ(records[0].folder, "iphone15");
    EXPECT_EQ(records[3].platform, "android");
    EXPECT_EQ(records[3].language, "de");
}

TEST(MatrixTest, GithubIncludeList) {
    auto matrix = renderMatrix(samplePlan(), MatrixFormat::GitHub);
    ASSERT_TRUE(matrix.contains("include"));
    const auto& include = matrix["include"];
    ASSERT_EQ(include.size(), 4u);

    EXPECT_EQ(include[0]["job_id"], "job-0");
    EXPECT_EQ(include[0]["platform"], "ios");
    EXPECT_EQ(include[0]["device"], "iphone15");
    EXPECT_EQ(include[0]["language"], "en");
    EXPECT_EQ(include[0]["screenshots"], 1);
    EXPECT_EQ(include[2]["output_dir"], (std::filesystem::path("shots") / "Android" / "pixel7" / "en").string());
}

TEST(MatrixTest, GitlabVariables) {
    auto matrix = renderMatrix(samplePlan(), MatrixFormat::GitLab);
    ASSERT_EQ(matrix.size(), 4u);
    ASSERT_TRUE(matrix.contains("JOB_3"));
    EXPECT_EQ(matrix["JOB_3"]["PLATFORM"], "android");
    EXPECT_EQ(matrix["JOB_3"]["DEVICE"], "pixel7");
    EXPECT_EQ(matrix["JOB_3"]["LANGUAGE"], "de");
    EXPECT_TRUE(matrix["JOB_3"].contains("OUTPUT_DIR"));
}

TEST(MatrixTest, AzureStrategyMatrix) {
    auto matrix = renderMatrix(samplePlan(), MatrixFormat::Azure);
    const auto& jobs = matrix.at("strategy").at("matrix");
    ASSERT_EQ(jobs.size(), 4u);
    EXPECT_EQ(jobs.at("job_1").at("language"), "de");
    EXPECT_EQ(jobs.at("job_1").at("platform"), "ios");
    EXPECT_TRUE(jobs.at("job_1").contains("outputDir"));
}

TEST(MatrixTest, GroupingKeepsPlanOrder) {
    auto plan = samplePlan();

    auto byPlatform = groupMatrix(plan, MatrixGroup::Platform);
    ASSERT_EQ(byPlatform.size(), 2u);
    EXPECT_EQ(byPlatform["ios"].size(), 2u);
    EXPECT_EQ(byPlatform["android"][0].id, "job-2");

    auto byDevice = groupMatrix(plan, MatrixGroup::Device);
    EXPECT_EQ(byDevice.count("iphone15"), 1u);
    EXPECT_EQ(byDevice.count("pixel7"), 1u);

    auto byLanguage = groupMatrix(plan, MatrixGroup::Language);
    ASSERT_EQ(byLanguage["de"].size(), 2u);
    EXPECT_EQ(byLanguage["de"][0].id, "job-1");
    EXPECT_EQ(byLanguage["de"][1].id, "job-3");
}

TEST(MatrixTest, ParsesFormatAndGroupNames) {
    EXPECT_EQ(parseMatrixFormat("GitHub"), MatrixFormat::GitHub);
    EXPECT_EQ(parseMatrixFormat("gitlab"), MatrixFormat::GitLab);
    EXPECT_EQ(parseMatrixFormat("AZURE"), MatrixFormat::Azure);
    EXPECT_FALSE(parseMatrixFormat("jenkins").has_value());

    EXPECT_EQ(parseMatrixGroup("device"), MatrixGroup::Device);
    EXPECT_FALSE(parseMatrixGroup("os").has_value());
}

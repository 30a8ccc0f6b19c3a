/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/orchestrator.hpp"
#include "snapmx/executor.hpp"
#include "snapmx/logger.hpp"
#include "snapmx/pool.hpp"
#include "snapmx/profile.hpp"
#include <algorithm>
#include <thread>
#include <utility>

namespace snapmx {

namespace {

// Result for a job that never reached a worker.
JobResult notStarted(const RunJob& job, JobStatus status, const std::string& reason) {
    JobResult result;
    result.index = job.index;
    result.key = job.key();
    result.platform = job.platform;
    result.deviceName = job.deviceName();
    result.deviceFolder = job.deviceFolder();
    result.language = job.language;
    result.outputDir = job.outputDir;
    result.status = status;
    result.phases.push_back(status == JobStatus::Cancelled ? JobPhase::Cancelled : JobPhase::Failed);
    result.errorKind = status == JobStatus::Cancelled ? ErrorKind::Cancelled : ErrorKind::Provisioning;
    result.error = reason;
    result.startedAt = result.finishedAt = Clock::now();
    return result;
}

}

Orchestrator::Orchestrator(OrchestratorServices services) noexcept
    : services_(services) {}

std::size_t Orchestrator::degreeOfParallelism(std::size_t jobCount, unsigned processorCount) noexcept {
    std::size_t half = processorCount / 2;
    return std::max<std::size_t>(1, std::min(jobCount, half));
}

JobResult Orchestrator::runJob(const RunJob& job, const Config& config,
                               const RunOverrides& overrides,
                               const CancellationToken& token) {
    auto profile = makeProfile(job.platform);
    DeviceDriver& driver = job.platform == Platform::iOS ? services_.iosDriver : services_.androidDriver;

    JobOptions options;
    options.appOverride = job.platform == Platform::iOS ? overrides.iosAppPath : overrides.androidAppPath;
    options.skipInstall = overrides.skipInstall;

    JobExecutor executor(job, config, *profile,
                         JobServices{driver, services_.sessions, services_.images, services_.registry},
                         options);
    return executor.execute(token);
}

RunResult Orchestrator::execute(const RunPlan& plan, const Config& config,
                                const RunOverrides& overrides,
                                const CancellationToken& token) {
    RunResult run;
    run.runId = newRunId();
    run.startedAt = Clock::now();
    run.environment = EnvironmentInfo::current();

    const std::size_t jobCount = plan.jobs.size();
    std::size_t parallelism = degreeOfParallelism(jobCount, std::thread::hardware_concurrency());
    if (overrides.maxParallelism && *overrides.maxParallelism > 0) {
        parallelism = std::min(parallelism, *overrides.maxParallelism);
    }

    LOG_INFO("Run " + run.runId + ": " + std::to_string(jobCount) + " jobs, parallelism " +
             std::to_string(parallelism));

    // One slot per job index; each slot is written by exactly one worker
    std::vector<std::optional<JobResult>> slots(jobCount);

    if (jobCount > 0) {
        Pool pool(static_cast<int>(parallelism));
        bool started = pool.start([&](std::size_t index, int) {
            const RunJob& job = plan.jobs[index];
            if (token.cancelled()) {
                slots[index] = notStarted(job, JobStatus::Cancelled, "Cancelled before start");
                return;
            }
            slots[index] = runJob(job, config, overrides, token);
        });

        if (started) {
            for (std::size_t i = 0; i < jobCount; ++i) {
                if (!pool.submit(i)) {
                    slots[i] = notStarted(plan.jobs[i], JobStatus::Failed, "Job could not be scheduled");
                }
            }
            pool.waitIdle();
        } else {
            run.error = "Worker pool failed to start";
        }
        pool.stop();
    }

    run.jobs.reserve(jobCount);
    for (std::size_t i = 0; i < jobCount; ++i) {
        if (!slots[i]) {
            slots[i] = token.cancelled()
                ? notStarted(plan.jobs[i], JobStatus::Cancelled, "Cancelled before start")
                : notStarted(plan.jobs[i], JobStatus::Failed, "Job did not run");
        }
        run.jobs.push_back(std::move(*slots[i]));
    }

    run.finishedAt = Clock::now();
    run.summary = summarize(run.jobs);
    run.success = !run.error && allSucceeded(run.jobs);
    if (token.cancelled() && !run.error) {
        run.error = "Run cancelled";
    }

    LOG_INFO("Run " + run.runId + " finished: " + std::to_string(run.summary.successfulJobs) + "/" +
             std::to_string(run.summary.totalJobs) + " succeeded, " +
             std::to_string(run.summary.failedJobs) + " failed, " +
             std::to_string(run.summary.cancelledJobs) + " cancelled");
    return run;
}

}

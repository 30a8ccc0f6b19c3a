/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>

#include "snapmx/cancel.hpp"
#include "snapmx/config.hpp"
#include "snapmx/drivers.hpp"
#include "snapmx/plan.hpp"
#include "snapmx/registry.hpp"
#include "snapmx/result.hpp"

namespace snapmx {

struct RunOverrides {
    std::optional<std::filesystem::path> iosAppPath;
    std::optional<std::filesystem::path> androidAppPath;
    bool skipInstall = false;
    std::optional<std::size_t> maxParallelism;   // caps the computed degree
};

struct OrchestratorServices {
    DeviceDriver& iosDriver;
    DeviceDriver& androidDriver;
    SessionProvider& sessions;
    ImageInspector& images;
    ProcessRegistry& registry;
};

// Fans a RunPlan out over a worker pool, one JobExecutor per job.
// No per-job watchdog: a hung session holds its worker until it returns.
class Orchestrator {
public:
    explicit Orchestrator(OrchestratorServices services) noexcept;

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    [[nodiscard]] RunResult execute(const RunPlan& plan, const Config& config,
                                    const RunOverrides& overrides,
                                    const CancellationToken& token);

    // max(1, min(jobCount, processorCount / 2))
    [[nodiscard]] static std::size_t degreeOfParallelism(std::size_t jobCount,
                                                         unsigned processorCount) noexcept;

private:
    [[nodiscard]] JobResult runJob(const RunJob& job, const Config& config,
                                   const RunOverrides& overrides,
                                   const CancellationToken& token);

    OrchestratorServices services_;
};

}

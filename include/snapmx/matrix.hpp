/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "snapmx/plan.hpp"

namespace snapmx {

// Read-only projection of one RunJob for CI matrices.
struct MatrixRecord {
    JobKey id;                 // "job-<index>"
    std::size_t index = 0;
    std::string platform;      // "ios" / "android"
    std::string device;        // device name
    std::string folder;
    std::string language;
    std::size_t screenshots = 0;
    std::string outputDir;
    PortAllocation ports;
};

enum class MatrixFormat : uint8_t { GitHub, GitLab, Azure };
enum class MatrixGroup : uint8_t { Platform, Device, Language };

[[nodiscard]] std::optional<MatrixFormat> parseMatrixFormat(const std::string& text) noexcept;
[[nodiscard]] std::optional<MatrixGroup> parseMatrixGroup(const std::string& text) noexcept;

[[nodiscard]] std::vector<MatrixRecord> matrixRecords(const RunPlan& plan);

// Records keyed by platform slug, device folder or language; plan order is
// kept inside each group.
[[nodiscard]] std::map<std::string, std::vector<MatrixRecord>> groupMatrix(const RunPlan& plan,
                                                                           MatrixGroup key);

// github: {"include": [...]}, gitlab: {"JOB_<i>": {...}},
// azure: {"strategy": {"matrix": {"job_<i>": {...}}}}
[[nodiscard]] nlohmann::json renderMatrix(const RunPlan& plan, MatrixFormat format);

}

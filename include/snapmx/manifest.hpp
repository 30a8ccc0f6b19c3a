/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "snapmx/result.hpp"

namespace snapmx {

struct ManifestFiles {
    bool ok = false;
    std::filesystem::path manifestPath;   // run_manifest.json
    std::filesystem::path summaryPath;    // run_summary.txt
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Serializes a finished RunResult; nothing is recomputed here.
class ManifestWriter {
public:
    static constexpr const char* kManifestFile = "run_manifest.json";
    static constexpr const char* kSummaryFile = "run_summary.txt";

    [[nodiscard]] ManifestFiles write(const RunResult& result,
                                      const std::filesystem::path& outputDir) const noexcept;

    [[nodiscard]] static nlohmann::json toJson(const RunResult& result);
    [[nodiscard]] static std::string toSummary(const RunResult& result);
};

}

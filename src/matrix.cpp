/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/matrix.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

using json = nlohmann::json;

namespace snapmx {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

json github(const std::vector<MatrixRecord>& records) {
    json include = json::array();
    for (const auto& r : records) {
        include.push_back({
            {"job_id", r.id},
            {"platform", r.platform},
            {"device", r.folder},
            {"language", r.language},
            {"screenshots", r.screenshots},
            {"output_dir", r.outputDir}
        });
    }
    return json{{"include", include}};
}

json gitlab(const std::vector<MatrixRecord>& records) {
    json variables = json::object();
    for (const auto& r : records) {
        variables["JOB_" + std::to_string(r.index)] = {
            {"PLATFORM", r.platform},
            {"DEVICE", r.folder},
            {"LANGUAGE", r.language},
            {"OUTPUT_DIR", r.outputDir}
        };
    }
    return variables;
}

json azure(const std::vector<MatrixRecord>& records) {
    json matrix = json::object();
    for (const auto& r : records) {
        matrix["job_" + std::to_string(r.index)] = {
            {"platform", r.platform},
            {"device", r.folder},
            {"language", r.language},
            {"outputDir", r.outputDir}
        };
    }
    return json{{"strategy", {{"matrix", matrix}}}};
}

}

std::optional<MatrixFormat> parseMatrixFormat(const std::string& text) noexcept {
    std::string value = lower(text);
    if (value == "github") return MatrixFormat::GitHub;
    if (value == "gitlab") return MatrixFormat::GitLab;
    if (value == "azure") return MatrixFormat::Azure;
    return std::nullopt;
}

std::optional<MatrixGroup> parseMatrixGroup(const std::string& text) noexcept {
    std::string value = lower(text);
    if (value == "platform") return MatrixGroup::Platform;
    if (value == "device") return MatrixGroup::Device;
    if (value == "language") return MatrixGroup::Language;
    return std::nullopt;
}

std::vector<MatrixRecord> matrixRecords(const RunPlan& plan) {
    std::vector<MatrixRecord> records;
    records.reserve(plan.jobs.size());
    for (const auto& job : plan.jobs) {
        MatrixRecord r;
        r.id = job.key();
        r.index = job.index;
        r.platform = platformSlug(job.platform);
        r.device = job.deviceName();
        r.folder = job.deviceFolder();
        r.language = job.language;
        r.screenshots = job.screenshots.size();
        r.outputDir = job.outputDir.string();
        r.ports = job.ports;
        records.push_back(std::move(r));
    }
    return records;
}

std::map<std::string, std::vector<MatrixRecord>> groupMatrix(const RunPlan& plan, MatrixGroup key) {
    std::map<std::string, std::vector<MatrixRecord>> groups;
    for (auto& record : matrixRecords(plan)) {
        std::string group;
        switch (key) {
            case MatrixGroup::Platform: group = record.platform; break;
            case MatrixGroup::Device:   group = record.folder; break;
            case MatrixGroup::Language: group = record.language; break;
        }
        groups[group].push_back(std::move(record));
    }
    return groups;
}

json renderMatrix(const RunPlan& plan, MatrixFormat format) {
    auto records = matrixRecords(plan);
    switch (format) {
        case MatrixFormat::GitHub: return github(records);
        case MatrixFormat::GitLab: return gitlab(records);
        case MatrixFormat::Azure:  return azure(records);
    }
    return json::object();
}

}

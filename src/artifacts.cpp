/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/artifacts.hpp"
#include "snapmx/logger.hpp"
#include <cctype>
#include <system_error>
#include <utility>

namespace snapmx {

GlobArtifactResolver::GlobArtifactResolver(BuildConfig build) noexcept
    : build_(std::move(build)) {}

std::optional<std::filesystem::path> GlobArtifactResolver::resolveArtifact(
    Platform platform,
    const std::optional<std::filesystem::path>& overridePath) const {
    if (overridePath) {
        std::error_code ec;
        if (std::filesystem::exists(*overridePath, ec)) {
            return std::filesystem::absolute(*overridePath, ec);
        }
        LOG_ERROR(std::string(platformName(platform)) + " app override not found: " + overridePath->string());
        return std::nullopt;
    }

    const auto& glob = platform == Platform::iOS ? build_.ios.artifactGlob : build_.android.artifactGlob;
    if (!glob) {
        LOG_DEBUG(std::string("No artifact_glob configured for ") + platformName(platform));
        return std::nullopt;
    }

    auto found = resolveGlob(*glob);
    if (found) {
        LOG_DEBUG(std::string(platformName(platform)) + " artifact: " + found->string());
    } else {
        LOG_WARN(std::string("No ") + platformName(platform) + " artifact matches " + *glob);
    }
    return found;
}

std::optional<std::filesystem::path> GlobArtifactResolver::resolveGlob(const std::string& pattern) noexcept {
    try {
        std::filesystem::path globPath(pattern);
        std::filesystem::path directory = globPath.parent_path();
        if (directory.empty()) {
            directory = ".";
        }
        const std::string namePattern = globPath.filename().string();

        std::error_code ec;
        directory = std::filesystem::absolute(directory, ec);
        if (ec || !std::filesystem::is_directory(directory, ec)) {
            return std::nullopt;
        }

        std::optional<std::filesystem::path> newest;
        std::filesystem::file_time_type newestTime{};

        auto options = std::filesystem::directory_options::skip_permission_denied;
        for (auto it = std::filesystem::recursive_directory_iterator(directory, options, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            if (!wildcardMatch(namePattern, entry.path().filename().string())) {
                continue;
            }
            std::error_code timeEc;
            auto modified = std::filesystem::last_write_time(entry.path(), timeEc);
            if (timeEc) {
                continue;
            }
            if (!newest || modified > newestTime) {
                newest = entry.path();
                newestTime = modified;
            }
        }
        return newest;
    } catch (const std::exception& e) {
        LOG_ERROR("Artifact glob error for " + pattern + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

bool GlobArtifactResolver::wildcardMatch(const std::string& pattern, const std::string& name) noexcept {
    std::size_t p = 0, n = 0;
    std::size_t starP = std::string::npos, starN = 0;

    auto same = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    };

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || same(pattern[p], name[n]))) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starN = n;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            n = ++starN;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}

/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "snapmx/config.hpp"
#include "snapmx/types.hpp"

namespace snapmx {

// Locates an already-built application artifact for a platform.
class ArtifactResolver {
public:
    virtual ~ArtifactResolver() = default;

    [[nodiscard]] virtual std::optional<std::filesystem::path> resolveArtifact(
        Platform platform,
        const std::optional<std::filesystem::path>& overridePath) const = 0;
};

// Resolves build_config.<platform>.artifact_glob against the filesystem.
// The directory part is literal; '*' and '?' in the file name part match
// case-insensitively anywhere below it. Newest match wins, directories
// (.app bundles) included.
class GlobArtifactResolver final : public ArtifactResolver {
public:
    explicit GlobArtifactResolver(BuildConfig build) noexcept;

    [[nodiscard]] std::optional<std::filesystem::path> resolveArtifact(
        Platform platform,
        const std::optional<std::filesystem::path>& overridePath) const override;

    [[nodiscard]] static std::optional<std::filesystem::path> resolveGlob(const std::string& pattern) noexcept;
    [[nodiscard]] static bool wildcardMatch(const std::string& pattern, const std::string& name) noexcept;

private:
    BuildConfig build_;
};

}

/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "snapmx/config.hpp"
#include "snapmx/errors.hpp"

namespace snapmx {

// Ports reserved for one job. Only one aux port is used per job, but both
// are reserved so the layout does not depend on the platform.
struct PortAllocation {
    int automationPort = 0;
    int iosAuxPort = 0;      // WebDriverAgent local port
    int androidAuxPort = 0;  // UiAutomator2 system port

    [[nodiscard]] std::vector<int> ports() const { return {automationPort, iosAuxPort, androidAuxPort}; }
};

struct PortResult {
    bool ok = false;
    PortAllocation allocation;
    PlanError error = PlanError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Pure mapping from job index to a disjoint block of ports:
// [base + index*offset, base + (index+1)*offset).
class PortAllocator {
public:
    explicit PortAllocator(int basePort = defaults::kBasePort,
                           int portOffset = defaults::kPortOffset) noexcept;

    [[nodiscard]] PortResult allocate(std::size_t jobIndex) const;
    [[nodiscard]] PortResult validate() const;

    // Number of job blocks that fit between the base port and 65535.
    [[nodiscard]] std::size_t maxParallelJobs() const noexcept;

    [[nodiscard]] int basePort() const noexcept { return basePort_; }
    [[nodiscard]] int portOffset() const noexcept { return portOffset_; }

    static constexpr int kPortsPerJob = 3;

private:
    int basePort_;
    int portOffset_;
};

// True if no port appears twice across the given allocations.
[[nodiscard]] bool validateAllocations(const std::vector<PortAllocation>& allocations);

}

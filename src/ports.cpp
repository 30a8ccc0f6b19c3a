/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/ports.hpp"
#include "snapmx/logger.hpp"
#include <cstdint>
#include <unordered_set>

namespace snapmx {

PortAllocator::PortAllocator(int basePort, int portOffset) noexcept
    : basePort_(basePort), portOffset_(portOffset) {}

PortResult PortAllocator::validate() const {
    if (basePort_ < defaults::kMinPort || basePort_ > defaults::kMaxPort) {
        return {false, {}, PlanError::InvalidPorts,
                "Base port " + std::to_string(basePort_) + " outside valid range " +
                std::to_string(defaults::kMinPort) + "-" + std::to_string(defaults::kMaxPort)};
    }
    if (portOffset_ < kPortsPerJob || portOffset_ > defaults::kMaxPortOffset) {
        return {false, {}, PlanError::InvalidPorts,
                "Port offset " + std::to_string(portOffset_) + " outside valid range " +
                std::to_string(kPortsPerJob) + "-" + std::to_string(defaults::kMaxPortOffset)};
    }
    return {true, {}, PlanError::None, ""};
}

PortResult PortAllocator::allocate(std::size_t jobIndex) const {
    auto check = validate();
    if (!check) {
        return check;
    }

    // 64-bit arithmetic so huge indices report an error instead of wrapping
    const std::int64_t blockStart = static_cast<std::int64_t>(basePort_) +
                                    static_cast<std::int64_t>(jobIndex) * portOffset_;
    const std::int64_t blockEnd = blockStart + portOffset_ - 1;
    if (blockEnd > defaults::kMaxPort) {
        return {false, {}, PlanError::InvalidPorts,
                "Job " + std::to_string(jobIndex) + " needs ports " + std::to_string(blockStart) +
                "-" + std::to_string(blockEnd) + ", beyond " + std::to_string(defaults::kMaxPort)};
    }

    PortAllocation allocation;
    allocation.automationPort = static_cast<int>(blockStart);
    allocation.iosAuxPort = allocation.automationPort + 1;
    allocation.androidAuxPort = allocation.automationPort + 2;

    LOG_TRACE("Job " + std::to_string(jobIndex) + " ports: " +
              std::to_string(allocation.automationPort) + "/" +
              std::to_string(allocation.iosAuxPort) + "/" +
              std::to_string(allocation.androidAuxPort));
    return {true, allocation, PlanError::None, ""};
}

std::size_t PortAllocator::maxParallelJobs() const noexcept {
    if (!validate()) {
        return 0;
    }
    return static_cast<std::size_t>((defaults::kMaxPort - basePort_) / portOffset_);
}

bool validateAllocations(const std::vector<PortAllocation>& allocations) {
    std::unordered_set<int> seen;
    for (const auto& allocation : allocations) {
        for (int port : allocation.ports()) {
            if (!seen.insert(port).second) {
                LOG_WARN("Port conflict detected: " + std::to_string(port));
                return false;
            }
        }
    }
    return true;
}

}

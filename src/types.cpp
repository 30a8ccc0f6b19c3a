/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/types.hpp"

namespace snapmx {

const char* platformName(Platform platform) noexcept {
    switch (platform) {
        case Platform::iOS:     return "iOS";
        case Platform::Android: return "Android";
        default: return "Unknown";
    }
}

const char* platformSlug(Platform platform) noexcept {
    switch (platform) {
        case Platform::iOS:     return "ios";
        case Platform::Android: return "android";
        default: return "unknown";
    }
}

const char* statusName(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Success:   return "success";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* phaseName(JobPhase phase) noexcept {
    switch (phase) {
        case JobPhase::Pending:      return "Pending";
        case JobPhase::Provisioning: return "Provisioning";
        case JobPhase::Executing:    return "Executing";
        case JobPhase::Validating:   return "Validating";
        case JobPhase::Succeeded:    return "Succeeded";
        case JobPhase::Failed:       return "Failed";
        case JobPhase::Cancelled:    return "Cancelled";
        default: return "Unknown";
    }
}

const char* orientationName(Orientation orientation) noexcept {
    switch (orientation) {
        case Orientation::Portrait:  return "portrait";
        case Orientation::Landscape: return "landscape";
        default: return "unspecified";
    }
}

bool isTerminal(JobPhase phase) noexcept {
    return phase == JobPhase::Succeeded || phase == JobPhase::Failed || phase == JobPhase::Cancelled;
}

}

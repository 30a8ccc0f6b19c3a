/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/errors.hpp"

namespace snapmx {

const char* planErrorName(PlanError error) noexcept {
    switch (error) {
        case PlanError::None:             return "none";
        case PlanError::InvalidPorts:     return "invalid-ports";
        case PlanError::InvalidFilter:    return "invalid-filter";
        case PlanError::MissingLocale:    return "missing-locale";
        case PlanError::ArtifactRequired: return "artifact-required";
        case PlanError::EmptyPlan:        return "empty-plan";
        default: return "unknown";
    }
}

const char* configErrorName(ConfigErrorCode code) noexcept {
    switch (code) {
        case ConfigErrorCode::None:         return "none";
        case ConfigErrorCode::IoError:      return "io-error";
        case ConfigErrorCode::ParseError:   return "parse-error";
        case ConfigErrorCode::InvalidValue: return "invalid-value";
        default: return "unknown";
    }
}

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Provisioning: return "provisioning";
        case ErrorKind::Action:       return "action";
        case ErrorKind::Validation:   return "validation";
        case ErrorKind::Teardown:     return "teardown";
        case ErrorKind::Cancelled:    return "cancelled";
        default: return "unknown";
    }
}

}

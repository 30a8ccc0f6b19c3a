/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace snapmx {

// Plan-stage failures. All of them abort before any job starts.
enum class PlanError : uint8_t {
    None = 0,
    InvalidPorts,
    InvalidFilter,
    MissingLocale,
    ArtifactRequired,
    EmptyPlan
};

enum class ConfigErrorCode : uint8_t {
    None = 0,
    IoError,
    ParseError,
    InvalidValue
};

// Job-scoped failure categories.
enum class ErrorKind : uint8_t {
    Provisioning,
    Action,
    Validation,
    Teardown,
    Cancelled
};

const char* planErrorName(PlanError error) noexcept;
const char* configErrorName(ConfigErrorCode code) noexcept;
const char* errorKindName(ErrorKind kind) noexcept;

// Thrown by collaborators and by the executor inside a job. Never escapes
// JobExecutor::execute.
class JobError : public std::runtime_error {
public:
    JobError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ProvisioningError : public JobError {
public:
    explicit ProvisioningError(const std::string& message) : JobError(ErrorKind::Provisioning, message) {}
};

class ActionError : public JobError {
public:
    explicit ActionError(const std::string& message) : JobError(ErrorKind::Action, message) {}
};

class ValidationError : public JobError {
public:
    explicit ValidationError(const std::string& message) : JobError(ErrorKind::Validation, message) {}
};

class CancelledError : public JobError {
public:
    CancelledError() : JobError(ErrorKind::Cancelled, "Operation cancelled") {}
};

}

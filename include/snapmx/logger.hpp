/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace snapmx {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Accepts error|warn|warning|info|debug|trace, any case.
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
    static std::string timestamp();
    static std::string threadLabel();
};

// Thread naming for log attribution (workers are "Worker-<n>")
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

// Tags every line logged on this thread with a job key while in scope.
// Scopes nest; the previous tag comes back on destruction.
class JobLogScope {
public:
    explicit JobLogScope(const std::string& jobKey);
    ~JobLogScope();

    JobLogScope(const JobLogScope&) = delete;
    JobLogScope& operator=(const JobLogScope&) = delete;

private:
    std::string previous_;
};

// Job key of the innermost scope on this thread, empty outside a job.
[[nodiscard]] std::string currentJobContext();

}

#define LOG_ERROR(msg) ::snapmx::Logger::error(msg)
#define LOG_WARN(msg)  ::snapmx::Logger::warn(msg)
#define LOG_INFO(msg)  ::snapmx::Logger::info(msg)
#define LOG_DEBUG(msg) ::snapmx::Logger::debug(msg)
#define LOG_TRACE(msg) ::snapmx::Logger::trace(msg)

/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace snapmx {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

namespace {
thread_local std::string t_job_context;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "."
       << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::threadLabel() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    auto it = g_thread_names.find(std::this_thread::get_id());
    if (it != g_thread_names.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

// Line shape: [time] [LEVEL] [thread] [job-N] message
void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        std::ostringstream line;
        line << "[" << timestamp() << "] [" << levelToString(level) << "] [" << threadLabel() << "]";
        if (!t_job_context.empty()) {
            line << " [" << t_job_context << "]";
        }
        line << " " << message;

        // stdout is reserved for command output (matrix JSON, plan listings)
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::cerr << line.str() << std::endl;
    } catch (...) {
        // Logging must never throw
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) noexcept {
    try {
        std::string level_str(text);
        std::transform(level_str.begin(), level_str.end(), level_str.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (level_str == "error") return LogLevel::ERROR;
        if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
        if (level_str == "info") return LogLevel::INFO;
        if (level_str == "debug") return LogLevel::DEBUG;
        if (level_str == "trace") return LogLevel::TRACE;
    } catch (...) {
    }
    return std::nullopt;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("SNAPMX_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return parseLevel(env_val).value_or(LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

JobLogScope::JobLogScope(const std::string& jobKey) : previous_(t_job_context) {
    t_job_context = jobKey;
}

JobLogScope::~JobLogScope() {
    t_job_context.swap(previous_);
}

std::string currentJobContext() {
    return t_job_context;
}

}

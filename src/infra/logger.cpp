/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats entries with a local timestamp, a severity tag and ANSI colour codes,
 * and filters them against the process-wide minimum level.
 */

#include "idforge/infra/logger.hpp"

#include "idforge/core/error.hpp"
#include "idforge/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace idforge::infra {

namespace {

/// ANSI colour and fixed-width tag for each severity.
const char* style_for(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "\033[90m[TRCE] ";
    case LogLevel::DEBUG:
        return "\033[36m[DBUG] ";
    case LogLevel::INFO:
        return "\033[32m[INFO] ";
    case LogLevel::WARN:
        return "\033[33m[WARN] ";
    case LogLevel::ERROR:
        return "\033[31m[FAIL] ";
    case LogLevel::FATAL:
        return "\033[1;31m[CRIT] ";
    }
    return "";
}

} // namespace

std::mutex Logger::mutex_;
std::atomic<int> Logger::min_level_{static_cast<int>(LogLevel::INFO)};
std::atomic<bool> Logger::stderr_only_{false};

void Logger::set_level(LogLevel level)
{
    min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level()
{
    return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel level)
{
    return static_cast<int>(level) >= min_level_.load(std::memory_order_relaxed);
}

void Logger::redirect_to_stderr(bool enabled)
{
    stderr_only_.store(enabled, std::memory_order_relaxed);
}

LogLevel Logger::parse_level(const std::string& name)
{
    const std::string key = String::to_lower(String::trim(name));
    if (key == "trace")
        return LogLevel::TRACE;
    if (key == "debug")
        return LogLevel::DEBUG;
    if (key == "info")
        return LogLevel::INFO;
    if (key == "warn" || key == "warning")
        return LogLevel::WARN;
    if (key == "error")
        return LogLevel::ERROR;
    if (key == "fatal")
        return LogLevel::FATAL;
    throw core::InvalidArgument("Unknown log level: '" + name + "'");
}

const char* Logger::level_name(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "trace";
    case LogLevel::DEBUG:
        return "debug";
    case LogLevel::INFO:
        return "info";
    case LogLevel::WARN:
        return "warn";
    case LogLevel::ERROR:
        return "error";
    case LogLevel::FATAL:
        return "fatal";
    }
    return "info";
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Entries below the minimum level are dropped before the lock is taken.
 * WARN and above always go to `stderr`; the rest follow `redirect_to_stderr`.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    bool to_err = level >= LogLevel::WARN || stderr_only_.load(std::memory_order_relaxed);
    auto& stream = to_err ? std::cerr : std::cout;

    // Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    stream << style_for(level) << message << "\033[0m" << std::endl;
}

} // namespace idforge::infra

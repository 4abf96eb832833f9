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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for idforge.
 *
 * @details
 * Declares the `Logger` class, the single reporting interface used by the
 * generation engine, the worker pool and the command-line tool. Output is
 * serialised across threads so entries never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace idforge::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (chunk plans, counter states).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (pool startup, configuration).
    WARN,  ///< Non-blocking anomalies (clock moved backwards).
    ERROR, ///< Failed requests that do not halt the process.
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured minimum level are discarded before the lock
 * is taken, so disabled TRACE/DEBUG calls cost one relaxed atomic load.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`, unless `redirect_to_stderr(true)` was called.
     * - `WARN`, `ERROR`, `FATAL`: always `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * idforge::infra::Logger::log(LogLevel::INFO, "Scheduler: 8 workers online.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that will be written.
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /// @brief Returns true when a message of @p level would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Sends every severity to `std::cerr`.
     *
     * Used by the command-line tool when stdout carries generated identifiers.
     */
    static void redirect_to_stderr(bool enabled);

    /**
     * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "fatal").
     *
     * Matching is case-insensitive.
     *
     * @throws idforge::core::InvalidArgument on an unknown name.
     */
    static LogLevel parse_level(const std::string& name);

    /// @brief Lower-case name of @p level, accepted back by `parse_level`.
    static const char* level_name(LogLevel level);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    static std::atomic<int> min_level_;
    static std::atomic<bool> stderr_only_;
};

} // namespace idforge::infra

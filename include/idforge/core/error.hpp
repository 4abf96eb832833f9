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
 * @file error.hpp
 * @brief Exception hierarchy raised by the generation engine.
 *
 * @details
 * Every failure is reported synchronously to the caller of the failing
 * operation. Nothing in the engine retries: a broken entropy source or clock
 * must surface rather than silently degrade identifier quality.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace idforge::core {

/**
 * @enum ErrorKind
 * @brief Classification of engine failures.
 */
enum class ErrorKind {
    EntropyUnavailable, ///< The OS random source failed. Fatal for the request.
    ClockUnavailable,   ///< The wall clock could not be read. Fatal for time-based families.
    InvalidArgument     ///< Negative count, bad size, malformed text or configuration.
};

/// @brief Returns the stable name of @p kind (e.g. "EntropyUnavailable").
const char* to_string(ErrorKind kind);

/**
 * @class Error
 * @brief Base class of all idforge exceptions.
 *
 * Catch `Error` and inspect `kind()` to branch on the failure class, or catch
 * one of the concrete subclasses below.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

class EntropyUnavailable : public Error {
  public:
    explicit EntropyUnavailable(const std::string& message)
        : Error(ErrorKind::EntropyUnavailable, message)
    {
    }
};

class ClockUnavailable : public Error {
  public:
    explicit ClockUnavailable(const std::string& message)
        : Error(ErrorKind::ClockUnavailable, message)
    {
    }
};

class InvalidArgument : public Error {
  public:
    explicit InvalidArgument(const std::string& message)
        : Error(ErrorKind::InvalidArgument, message)
    {
    }
};

} // namespace idforge::core

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

#include "idforge/core/error.hpp"

namespace idforge::core {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::EntropyUnavailable:
        return "EntropyUnavailable";
    case ErrorKind::ClockUnavailable:
        return "ClockUnavailable";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind)
{
}

} // namespace idforge::core

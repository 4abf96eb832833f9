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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Static helpers used when ingesting identifier text, command-line flags and
 * configuration values.
 */

#pragma once

#include <cstdint>
#include <string>

namespace idforge::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if @p s is blank.
     *
     * @code
     * std::string clean = idforge::infra::String::trim("  uuid7 \n"); // "uuid7"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief Returns an ASCII lower-cased copy of @p s.
    static std::string to_lower(const std::string& s);

    /**
     * @brief Returns @p s with every occurrence of @p c removed.
     *
     * Used to accept both hyphenated and compact UUID text.
     */
    static std::string strip(const std::string& s, char c);

    /**
     * @brief Parses a base-10 integer that must consume the whole (trimmed) input.
     *
     * Unlike `std::stoll`, trailing garbage ("12abc") and empty input are rejected.
     *
     * @throws idforge::core::InvalidArgument when the text is not a complete integer
     * or does not fit in 64 bits.
     */
    static std::int64_t parse_int(const std::string& s);
};

} // namespace idforge::infra

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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "idforge/infra/string.hpp"

#include "idforge/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace idforge::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string String::strip(const std::string& s, char c)
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        if (ch != c) {
            out.push_back(ch);
        }
    }
    return out;
}

std::int64_t String::parse_int(const std::string& s)
{
    const std::string text = trim(s);
    if (text.empty()) {
        throw core::InvalidArgument("Expected an integer, got an empty value");
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);

    if (errno == ERANGE) {
        throw core::InvalidArgument("Integer out of range: '" + text + "'");
    }
    if (end == text.c_str() || *end != '\0') {
        throw core::InvalidArgument("Not an integer: '" + text + "'");
    }
    return static_cast<std::int64_t>(value);
}

} // namespace idforge::infra

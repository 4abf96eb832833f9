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
 * @file codec.cpp
 * @brief Table-driven hex, Base64-URL and nano id codecs.
 */

#include "idforge/core/codec.hpp"

#include "idforge/core/error.hpp"

#include <array>

namespace idforge::core::codec {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr char kBase64Url[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int base64url_value(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '-')
        return 62;
    if (c == '_')
        return 63;
    return -1;
}

} // namespace

void format_uuid(const std::uint8_t* bytes, char* out)
{
    std::size_t pos = 0;
    for (std::size_t i = 0; i < 16; ++i) {
        // Hyphens before bytes 4, 6, 8 and 10 give the 8-4-4-4-12 grouping.
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out[pos++] = '-';
        }
        out[pos++] = kHexDigits[bytes[i] >> 4];
        out[pos++] = kHexDigits[bytes[i] & 0x0F];
    }
}

std::string format_uuid(const std::uint8_t* bytes)
{
    std::string out(kUuidTextLength, '\0');
    format_uuid(bytes, out.data());
    return out;
}

std::string format_hex(const std::uint8_t* data, std::size_t n)
{
    std::string out(n * 2, '\0');
    for (std::size_t i = 0; i < n; ++i) {
        out[2 * i] = kHexDigits[data[i] >> 4];
        out[2 * i + 1] = kHexDigits[data[i] & 0x0F];
    }
    return out;
}

std::vector<std::uint8_t> parse_hex(const std::string& text)
{
    if (text.size() % 2 != 0) {
        throw InvalidArgument("Hex text has odd length " + std::to_string(text.size()));
    }

    std::vector<std::uint8_t> out(text.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw InvalidArgument("Invalid hex character in '" + text + "'");
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string base64url_encode(const std::uint8_t* data, std::size_t n)
{
    std::string out;
    out.reserve((n * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 3 <= n; i += 3) {
        std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                          (static_cast<std::uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out.push_back(kBase64Url[(v >> 18) & 0x3F]);
        out.push_back(kBase64Url[(v >> 12) & 0x3F]);
        out.push_back(kBase64Url[(v >> 6) & 0x3F]);
        out.push_back(kBase64Url[v & 0x3F]);
    }

    const std::size_t rest = n - i;
    if (rest == 1) {
        std::uint32_t v = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kBase64Url[(v >> 18) & 0x3F]);
        out.push_back(kBase64Url[(v >> 12) & 0x3F]);
    } else if (rest == 2) {
        std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                          (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kBase64Url[(v >> 18) & 0x3F]);
        out.push_back(kBase64Url[(v >> 12) & 0x3F]);
        out.push_back(kBase64Url[(v >> 6) & 0x3F]);
    }
    return out;
}

std::vector<std::uint8_t> base64url_decode(const std::string& text)
{
    if (text.size() % 4 == 1) {
        throw InvalidArgument("Base64 text has impossible length " + std::to_string(text.size()));
    }

    std::vector<std::uint8_t> out;
    out.reserve(text.size() * 3 / 4);

    std::uint32_t acc = 0;
    unsigned bits = 0;
    for (char c : text) {
        int v = base64url_value(c);
        if (v < 0) {
            throw InvalidArgument("Invalid Base64-URL character '" + std::string(1, c) + "'");
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }

    // Leftover bits are padding inside the last symbol and must be zero.
    if ((acc & ((1u << bits) - 1)) != 0) {
        throw InvalidArgument("Non-canonical Base64 text '" + text + "'");
    }
    return out;
}

void validate_alphabet(const std::string& alphabet)
{
    if (alphabet.empty()) {
        throw InvalidArgument("Alphabet must not be empty");
    }
    if (alphabet.size() > 256) {
        throw InvalidArgument("Alphabet must have at most 256 symbols");
    }

    std::array<bool, 256> seen{};
    for (char c : alphabet) {
        auto idx = static_cast<unsigned char>(c);
        if (seen[idx]) {
            throw InvalidArgument("Alphabet contains duplicate symbol '" + std::string(1, c) + "'");
        }
        seen[idx] = true;
    }
}

std::uint8_t nano_mask(std::size_t alphabet_size)
{
    unsigned mask = 1;
    while (mask < alphabet_size - 1 && mask < 0xFF) {
        mask = (mask << 1) | 1;
    }
    return static_cast<std::uint8_t>(alphabet_size <= 1 ? 0 : mask);
}

std::size_t encode_nano(const std::uint8_t* random, std::size_t n, const std::string& alphabet,
                        std::uint8_t mask, std::size_t size, std::string& out)
{
    std::size_t used = 0;
    while (used < n && out.size() < size) {
        const std::size_t idx = random[used++] & mask;
        if (idx < alphabet.size()) {
            out.push_back(alphabet[idx]);
        }
    }
    return used;
}

} // namespace idforge::core::codec

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
 * @file codec.hpp
 * @brief Pure encoders and decoders between raw identifier bytes and text.
 *
 * @details
 * Nothing in this header touches shared state: every function is a
 * deterministic mapping of its arguments, safe to call from any thread.
 * Decoders reject any input that would not re-encode to itself.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace idforge::core::codec {

/// @brief Length of the hyphenated UUID rendering (8-4-4-4-12).
constexpr std::size_t kUuidTextLength = 36;

/// @brief Number of leading UUID v7 bytes rendered by a short id.
constexpr std::size_t kShortIdBytes = 12;

/// @brief Length of a short id (12 bytes in unpadded Base64).
constexpr std::size_t kShortIdLength = 16;

/// @brief Default nano id length.
constexpr std::size_t kNanoIdDefaultSize = 21;

/// @brief Upper bound accepted for a nano id length.
constexpr std::size_t kNanoIdMaxSize = 1024;

/// @brief The 64-symbol URL-safe nano id alphabet.
constexpr const char* kNanoAlphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz-_";

/**
 * @brief Renders 16 bytes as `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx` (lower-case hex).
 */
std::string format_uuid(const std::uint8_t* bytes);

/// @brief Writes the 36-character rendering into @p out without allocating.
void format_uuid(const std::uint8_t* bytes, char* out);

/// @brief Lower-case hex rendering of @p n bytes.
std::string format_hex(const std::uint8_t* data, std::size_t n);

/**
 * @brief Decodes hex text (either case).
 * @throws InvalidArgument on odd length or a non-hex character.
 */
std::vector<std::uint8_t> parse_hex(const std::string& text);

/**
 * @brief URL-safe Base64 (RFC 4648 section 5) without `=` padding.
 *
 * 12 bytes encode to exactly 16 characters; 16 bytes to 22.
 */
std::string base64url_encode(const std::uint8_t* data, std::size_t n);

/**
 * @brief Inverse of `base64url_encode`.
 * @throws InvalidArgument on padding, characters outside `[A-Za-z0-9_-]`, a length
 * that no byte string encodes to, or non-zero trailing bits.
 */
std::vector<std::uint8_t> base64url_decode(const std::string& text);

/**
 * @brief Checks a nano id alphabet.
 * @throws InvalidArgument if it is empty, longer than 256 symbols or has duplicates.
 */
void validate_alphabet(const std::string& alphabet);

/**
 * @brief Smallest all-ones bit mask covering every index of an alphabet of @p size.
 *
 * For the 64-symbol default alphabet the mask is 63 and no byte is ever rejected.
 */
std::uint8_t nano_mask(std::size_t alphabet_size);

/**
 * @brief Rejection-sampling step of the nano id encoder.
 *
 * Maps each random byte to `byte & mask`; indices inside the alphabet are
 * appended to @p out, the rest are discarded so every symbol stays equally
 * likely. Stops when @p out reaches @p size characters.
 *
 * @return The number of bytes of @p random consumed.
 */
std::size_t encode_nano(const std::uint8_t* random, std::size_t n, const std::string& alphabet,
                        std::uint8_t mask, std::size_t size, std::string& out);

} // namespace idforge::core::codec

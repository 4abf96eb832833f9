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
 * @file uuid.hpp
 * @brief Immutable 128-bit UUID value type.
 *
 * @details
 * `Uuid` stores the 16 raw bytes in network (big-endian) order. All textual
 * renderings are computed from those bytes by the pure functions in `codec.hpp`,
 * so two equal values always render identically.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace idforge::core {

/**
 * @enum Variant
 * @brief Layout family encoded in the top bits of byte 8.
 */
enum class Variant {
    NCS,       ///< 0xx: reserved, NCS backward compatibility.
    RFC4122,   ///< 10x: the layout produced by this library.
    Microsoft, ///< 110: reserved, Microsoft GUIDs.
    Future     ///< 111: reserved for future definition.
};

/// @brief Python-style variant description ("specified in RFC 4122", ...).
const char* to_string(Variant variant);

class Uuid {
  public:
    using Bytes = std::array<std::uint8_t, 16>;

    /// @brief Offset between the Gregorian epoch (1582-10-15) and Unix epoch in 100 ns units.
    static constexpr std::uint64_t kGregorianOffset = 0x01B21DD213814000ULL;

    /// @name Well-known name-space identifiers (RFC 4122, Appendix C).
    /// @{
    static const Uuid kNamespaceDns;
    static const Uuid kNamespaceUrl;
    static const Uuid kNamespaceOid;
    static const Uuid kNamespaceX500;
    /// @}

    /// @brief The nil UUID (all zero bytes).
    constexpr Uuid() : bytes_{} {}

    constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Builds a UUID from exactly 16 raw bytes.
     * @throws InvalidArgument if @p bytes does not hold 16 bytes.
     */
    static Uuid from_bytes(const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Parses hex text with or without hyphens.
     *
     * Accepts `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx` and the 32-digit compact form,
     * in either case, surrounded by optional whitespace.
     *
     * @throws InvalidArgument on any other input.
     */
    static Uuid parse(const std::string& text);

    const Bytes& bytes() const { return bytes_; }

    /// @brief Version nibble (1, 4, 7, ...). Meaningful only for the RFC 4122 variant.
    int version() const { return bytes_[6] >> 4; }

    Variant variant() const;

    bool is_nil() const;

    /// @brief Canonical 36-character hyphenated lower-case hex.
    std::string to_string() const;

    /// @brief 32 lower-case hex digits, no hyphens.
    std::string hex() const;

    /// @brief 22-character URL-safe Base64 of all 16 bytes.
    std::string base64() const;

    /// @brief 16-character URL-safe Base64 of the leading 12 bytes.
    std::string short_id() const;

    /// @brief Most significant 64 bits of the 128-bit integer value.
    std::uint64_t high() const;

    /// @brief Least significant 64 bits of the 128-bit integer value.
    std::uint64_t low() const;

    /**
     * @brief Embedded Unix timestamp in milliseconds.
     *
     * Defined for version 7 (the 48-bit prefix) and version 1 (the 60-bit
     * Gregorian timestamp converted to the Unix epoch). Returns 0 otherwise.
     */
    std::uint64_t unix_ts_ms() const;

    /// @brief Raw 60-bit timestamp of a version 1 UUID (100 ns since 1582-10-15).
    std::uint64_t v1_timestamp() const;

    /// @brief 14-bit clock sequence of a version 1 UUID.
    std::uint16_t clock_seq() const;

    /// @brief 48-bit node field of a version 1 UUID.
    std::uint64_t node() const;

    bool operator==(const Uuid& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const Uuid& o) const { return bytes_ != o.bytes_; }
    bool operator<(const Uuid& o) const { return bytes_ < o.bytes_; }

  private:
    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

} // namespace idforge::core

namespace std {

template <> struct hash<idforge::core::Uuid> {
    size_t operator()(const idforge::core::Uuid& u) const noexcept
    {
        uint64_t h = u.high() ^ (u.low() * 0x9E3779B97F4A7C15ULL);
        return static_cast<size_t>(h ^ (h >> 32));
    }
};

} // namespace std

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
 * @file uuid.cpp
 * @brief Accessors and renderings of the `Uuid` value type.
 */

#include "idforge/core/uuid.hpp"

#include "idforge/core/codec.hpp"
#include "idforge/core/error.hpp"
#include "idforge/infra/string.hpp"

#include <algorithm>

namespace idforge::core {

namespace {

std::uint64_t load_be(const std::uint8_t* p, std::size_t n)
{
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

} // namespace

// Version 1 identifiers that differ only in the last nibble of time_low.
const Uuid Uuid::kNamespaceDns{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                                           0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
const Uuid Uuid::kNamespaceUrl{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                                           0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
const Uuid Uuid::kNamespaceOid{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                                           0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
const Uuid Uuid::kNamespaceX500{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                                            0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

const char* to_string(Variant variant)
{
    switch (variant) {
    case Variant::NCS:
        return "reserved for NCS compatibility";
    case Variant::RFC4122:
        return "specified in RFC 4122";
    case Variant::Microsoft:
        return "reserved for Microsoft compatibility";
    case Variant::Future:
        return "reserved for future definition";
    }
    return "unknown";
}

Uuid Uuid::from_bytes(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.size() != 16) {
        throw InvalidArgument("UUID requires 16 bytes, got " + std::to_string(bytes.size()));
    }
    Bytes b;
    std::copy(bytes.begin(), bytes.end(), b.begin());
    return Uuid(b);
}

Uuid Uuid::parse(const std::string& text)
{
    const std::string trimmed = infra::String::trim(text);

    if (trimmed.size() == codec::kUuidTextLength) {
        // Hyphens are only accepted at the canonical group boundaries.
        for (std::size_t pos : {8u, 13u, 18u, 23u}) {
            if (trimmed[pos] != '-') {
                throw InvalidArgument("Malformed UUID text '" + text + "'");
            }
        }
    } else if (trimmed.size() != 32) {
        throw InvalidArgument("Malformed UUID text '" + text + "'");
    }

    const std::string compact = infra::String::strip(trimmed, '-');
    if (compact.size() != 32) {
        throw InvalidArgument("Malformed UUID text '" + text + "'");
    }
    return from_bytes(codec::parse_hex(compact));
}

Variant Uuid::variant() const
{
    const std::uint8_t b = bytes_[8];
    if ((b & 0x80) == 0)
        return Variant::NCS;
    if ((b & 0xC0) == 0x80)
        return Variant::RFC4122;
    if ((b & 0xE0) == 0xC0)
        return Variant::Microsoft;
    return Variant::Future;
}

bool Uuid::is_nil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::string Uuid::to_string() const
{
    return codec::format_uuid(bytes_.data());
}

std::string Uuid::hex() const
{
    return codec::format_hex(bytes_.data(), bytes_.size());
}

std::string Uuid::base64() const
{
    return codec::base64url_encode(bytes_.data(), bytes_.size());
}

std::string Uuid::short_id() const
{
    return codec::base64url_encode(bytes_.data(), codec::kShortIdBytes);
}

std::uint64_t Uuid::high() const
{
    return load_be(bytes_.data(), 8);
}

std::uint64_t Uuid::low() const
{
    return load_be(bytes_.data() + 8, 8);
}

std::uint64_t Uuid::v1_timestamp() const
{
    const std::uint64_t time_low = load_be(bytes_.data(), 4);
    const std::uint64_t time_mid = load_be(bytes_.data() + 4, 2);
    const std::uint64_t time_hi = load_be(bytes_.data() + 6, 2) & 0x0FFF;
    return (time_hi << 48) | (time_mid << 32) | time_low;
}

std::uint64_t Uuid::unix_ts_ms() const
{
    switch (version()) {
    case 7:
        return load_be(bytes_.data(), 6);
    case 1: {
        const std::uint64_t ts = v1_timestamp();
        return ts < kGregorianOffset ? 0 : (ts - kGregorianOffset) / 10'000;
    }
    default:
        return 0;
    }
}

std::uint16_t Uuid::clock_seq() const
{
    return static_cast<std::uint16_t>(load_be(bytes_.data() + 8, 2) & 0x3FFF);
}

std::uint64_t Uuid::node() const
{
    return load_be(bytes_.data() + 10, 6);
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
    return os << uuid.to_string();
}

} // namespace idforge::core

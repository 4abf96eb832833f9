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
 * @file codec_test.cpp
 * @brief Unit tests for the text codecs and the `Uuid` value type.
 */

#include "framework.hpp"
#include "idforge/core/codec.hpp"
#include "idforge/core/error.hpp"
#include "idforge/core/identifier.hpp"
#include "idforge/core/uuid.hpp"

#include <string>
#include <unordered_set>
#include <vector>

using idforge::core::InvalidArgument;
using idforge::core::Uuid;
namespace codec = idforge::core::codec;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::string encode(const std::string& s)
{
    return codec::base64url_encode(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

} // namespace

/**
 * @brief Canonical 8-4-4-4-12 rendering in lowercase hex.
 */
void test_format_uuid()
{
    const Uuid u = Uuid::from_bytes({0x12, 0x3e, 0x45, 0x67, 0xe8, 0x9b, 0x12, 0xd3, 0xa4, 0x56,
                                     0x42, 0x66, 0x14, 0x17, 0x40, 0x00});
    ASSERT_EQ(u.to_string(), std::string("123e4567-e89b-12d3-a456-426614174000"));
    ASSERT_EQ(u.hex(), std::string("123e4567e89b12d3a456426614174000"));
    ASSERT_EQ(u.high(), static_cast<std::uint64_t>(0x123e4567e89b12d3ULL));
    ASSERT_EQ(u.low(), static_cast<std::uint64_t>(0xa456426614174000ULL));
    ASSERT_EQ(u.version(), 1);
}

void test_hex_codec()
{
    const std::vector<std::uint8_t> raw = {0x00, 0xff, 0x10, 0xab};
    ASSERT_EQ(codec::format_hex(raw.data(), raw.size()), std::string("00ff10ab"));
    ASSERT_TRUE(codec::parse_hex("00FF10aB") == raw);

    ASSERT_THROWS(codec::parse_hex("abc"), InvalidArgument);
    ASSERT_THROWS(codec::parse_hex("zz"), InvalidArgument);
}

/**
 * @brief RFC 4648 test vectors in the URL-safe alphabet without padding.
 */
void test_base64url_vectors()
{
    ASSERT_EQ(encode(""), std::string(""));
    ASSERT_EQ(encode("f"), std::string("Zg"));
    ASSERT_EQ(encode("fo"), std::string("Zm8"));
    ASSERT_EQ(encode("foo"), std::string("Zm9v"));
    ASSERT_EQ(encode("foob"), std::string("Zm9vYg"));
    ASSERT_EQ(encode("fooba"), std::string("Zm9vYmE"));
    ASSERT_EQ(encode("foobar"), std::string("Zm9vYmFy"));

    // 0xfb 0xff exercises both URL-safe substitutions.
    const std::vector<std::uint8_t> url = {0xfb, 0xff};
    ASSERT_EQ(codec::base64url_encode(url.data(), url.size()), std::string("-_8"));

    ASSERT_TRUE(codec::base64url_decode("Zm9vYmE") == bytes_of("fooba"));
    ASSERT_TRUE(codec::base64url_decode("-_8") == url);
}

/**
 * @brief Decoder rejections.
 *
 * Scenarios verified:
 * - A length that no byte count can produce.
 * - Characters outside the URL-safe alphabet (including standard '+' and '/').
 * - Non-zero bits in the unused tail of the final symbol.
 */
void test_base64url_rejects()
{
    ASSERT_THROWS(codec::base64url_decode("Zm9vY"), InvalidArgument);
    ASSERT_THROWS(codec::base64url_decode("Zm+v"), InvalidArgument);
    ASSERT_THROWS(codec::base64url_decode("Zm/v"), InvalidArgument);
    ASSERT_THROWS(codec::base64url_decode("Zh"), InvalidArgument);
}

void test_uuid_parse_forms()
{
    const std::string canonical = "0190a6d3-7c1e-7b3a-9f00-123456789abc";
    const Uuid a = Uuid::parse(canonical);
    ASSERT_EQ(a.to_string(), canonical);
    ASSERT_EQ(Uuid::parse("0190A6D37C1E7B3A9F00123456789ABC"), a);
    ASSERT_EQ(Uuid::parse("  " + canonical + "\n"), a);
    ASSERT_EQ(a.version(), 7);
    ASSERT_TRUE(a.variant() == idforge::core::Variant::RFC4122);

    ASSERT_THROWS(Uuid::parse("0190a6d37-c1e-7b3a-9f00-123456789abc"), InvalidArgument);
    ASSERT_THROWS(Uuid::parse("0190a6d3-7c1e-7b3a-9f00-123456789ab"), InvalidArgument);
    ASSERT_THROWS(Uuid::parse("0190a6d3-7c1e-7b3a-9f00-123456789abg"), InvalidArgument);
    ASSERT_THROWS(Uuid::from_bytes(std::vector<std::uint8_t>(15, 0)), InvalidArgument);
}

void test_uuid_nil_and_variants()
{
    const Uuid nil;
    ASSERT_TRUE(nil.is_nil());
    ASSERT_EQ(nil.to_string(), std::string("00000000-0000-0000-0000-000000000000"));
    ASSERT_TRUE(nil.variant() == idforge::core::Variant::NCS);

    Uuid::Bytes b{};
    b[8] = 0xC0;
    ASSERT_TRUE(Uuid(b).variant() == idforge::core::Variant::Microsoft);
    b[8] = 0xE0;
    ASSERT_TRUE(Uuid(b).variant() == idforge::core::Variant::Future);
}

/// The RFC 4122 name-space identifiers carry their published values.
void test_uuid_namespaces()
{
    ASSERT_EQ(Uuid::kNamespaceDns.to_string(), std::string("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));
    ASSERT_EQ(Uuid::kNamespaceUrl.to_string(), std::string("6ba7b811-9dad-11d1-80b4-00c04fd430c8"));
    ASSERT_EQ(Uuid::kNamespaceOid.to_string(), std::string("6ba7b812-9dad-11d1-80b4-00c04fd430c8"));
    ASSERT_EQ(Uuid::kNamespaceX500.to_string(),
              std::string("6ba7b814-9dad-11d1-80b4-00c04fd430c8"));
    ASSERT_EQ(Uuid::kNamespaceDns.version(), 1);
    ASSERT_TRUE(Uuid::kNamespaceX500.variant() == idforge::core::Variant::RFC4122);
}

/// The hash specialization lets UUIDs key unordered containers.
void test_uuid_hash()
{
    std::unordered_set<Uuid> set;
    set.insert(Uuid::parse("00000000-0000-0000-0000-000000000001"));
    set.insert(Uuid::parse("00000000-0000-0000-0000-000000000001"));
    set.insert(Uuid::parse("00000000-0000-0000-0000-000000000002"));
    ASSERT_EQ(set.size(), static_cast<size_t>(2));
}

/**
 * @brief Alphabet validation and rejection-sampling masks.
 */
void test_nano_alphabet_rules()
{
    codec::validate_alphabet(codec::kNanoAlphabet);
    ASSERT_EQ(std::string(codec::kNanoAlphabet).size(), static_cast<size_t>(64));

    ASSERT_THROWS(codec::validate_alphabet(""), InvalidArgument);
    ASSERT_THROWS(codec::validate_alphabet("abca"), InvalidArgument);
    ASSERT_THROWS(codec::validate_alphabet(std::string(257, 'x')), InvalidArgument);

    ASSERT_EQ(static_cast<int>(codec::nano_mask(64)), 63);
    ASSERT_EQ(static_cast<int>(codec::nano_mask(10)), 15);
    ASSERT_EQ(static_cast<int>(codec::nano_mask(2)), 1);
    ASSERT_EQ(static_cast<int>(codec::nano_mask(1)), 0);
    ASSERT_EQ(static_cast<int>(codec::nano_mask(256)), 255);
}

/**
 * @brief Masked bytes that land outside the alphabet are discarded, not folded.
 */
void test_encode_nano_rejection()
{
    const std::string alphabet = "0123456789";
    const std::vector<std::uint8_t> random = {0x00, 0x0a, 0x0f, 0x03, 0x19, 0x09};
    std::string out;

    // 0x0a and 0x0f mask to 10 and 15 (rejected); 0x19 masks to 9.
    const std::size_t used =
        codec::encode_nano(random.data(), random.size(), alphabet, 15, 3, out);
    ASSERT_EQ(out, std::string("039"));
    ASSERT_EQ(used, static_cast<size_t>(5));
}

void test_identifier_accessors()
{
    const Uuid u = Uuid::parse("0190a6d3-7c1e-7b3a-9f00-123456789abc");
    const idforge::core::Identifier id(idforge::core::Family::Uuid7, u);
    ASSERT_TRUE(id.is_uuid());
    ASSERT_EQ(id.uuid(), u);
    ASSERT_EQ(id.bytes().size(), static_cast<size_t>(16));

    const idforge::core::Identifier sid(idforge::core::Family::ShortId, u.short_id());
    ASSERT_FALSE(sid.is_uuid());
    ASSERT_EQ(sid.to_string().size(), codec::kShortIdLength);
    const std::vector<std::uint8_t> head(u.bytes().begin(), u.bytes().begin() + 12);
    ASSERT_TRUE(sid.bytes() == head);
    ASSERT_THROWS(sid.uuid(), InvalidArgument);

    ASSERT_TRUE(idforge::core::parse_family(" NanoId ") == idforge::core::Family::NanoId);
    ASSERT_EQ(std::string(idforge::core::to_string(idforge::core::Family::ShortId)),
              std::string("short_id"));
    ASSERT_THROWS(idforge::core::parse_family("uuid5"), InvalidArgument);
}

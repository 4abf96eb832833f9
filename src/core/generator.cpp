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
 * @file generator.cpp
 * @brief RFC 4122 / RFC 9562 byte layouts and the single-value entry points.
 */

#include "idforge/core/generator.hpp"

#include "idforge/core/error.hpp"

#include <algorithm>

namespace idforge::core {

namespace {

void store_be(std::uint8_t* p, std::uint64_t v, std::size_t n)
{
    for (std::size_t i = 0; i < n; ++i) {
        p[n - 1 - i] = static_cast<std::uint8_t>(v >> (8 * i));
    }
}

} // namespace

std::uint64_t Generator::v1_timestamp(const Stamp& stamp)
{
    // One counter tick is a microsecond; the sequence selects the 100 ns slot.
    return Uuid::kGregorianOffset + stamp.tick * 10 + stamp.sequence;
}

Uuid Generator::assemble_v1(std::uint64_t gregorian_100ns, const V1Node& node)
{
    Uuid::Bytes b;
    store_be(b.data(), gregorian_100ns & 0xFFFFFFFF, 4);                      // time_low
    store_be(b.data() + 4, (gregorian_100ns >> 32) & 0xFFFF, 2);              // time_mid
    store_be(b.data() + 6, ((gregorian_100ns >> 48) & 0x0FFF) | 0x1000, 2);   // time_hi | version
    store_be(b.data() + 8, (node.clock_seq & 0x3FFF) | 0x8000, 2);            // variant | clock_seq
    store_be(b.data() + 10, node.node, 6);
    return Uuid(b);
}

Uuid Generator::assemble_v4(const std::uint8_t* random16)
{
    Uuid::Bytes b;
    std::copy(random16, random16 + 16, b.begin());
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);
    return Uuid(b);
}

Uuid Generator::assemble_v7(const Stamp& stamp, const std::uint8_t* random8)
{
    Uuid::Bytes b;
    store_be(b.data(), stamp.tick, 6);
    // rand_a holds the top 12 sequence bits, the first rand_b nibble the low 4.
    b[6] = static_cast<std::uint8_t>(0x70 | ((stamp.sequence >> 12) & 0x0F));
    b[7] = static_cast<std::uint8_t>((stamp.sequence >> 4) & 0xFF);
    b[8] = static_cast<std::uint8_t>(0x80 | ((stamp.sequence & 0x0F) << 2) | (random8[0] & 0x03));
    std::copy(random8 + 1, random8 + 8, b.begin() + 9);
    return Uuid(b);
}

void Generator::validate_nano_size(std::size_t size)
{
    if (size == 0 || size > codec::kNanoIdMaxSize) {
        throw InvalidArgument("Nano id size must be in 1.." +
                              std::to_string(codec::kNanoIdMaxSize) + ", got " +
                              std::to_string(size));
    }
}

void Generator::fill_nano(EntropySource& entropy, std::size_t size, const std::string& alphabet,
                          std::uint8_t mask, std::string& out)
{
    std::uint8_t random[256];
    out.reserve(size);

    while (out.size() < size) {
        const std::size_t need = size - out.size();
        // Expected bytes for `need` accepted symbols; exact for power-of-two alphabets.
        std::size_t step = (need * (static_cast<std::size_t>(mask) + 1) + alphabet.size() - 1) /
                           alphabet.size();
        step = std::min(std::max<std::size_t>(step, 1), sizeof(random));

        entropy.fill(random, step);
        codec::encode_nano(random, step, alphabet, mask, size, out);
    }
}

Uuid Generator::uuid1()
{
    const V1Node node = ctx_->v1_node();
    const Stamp stamp = ctx_->v1_counter().next();
    return assemble_v1(v1_timestamp(stamp), node);
}

Uuid Generator::uuid4()
{
    std::uint8_t random[16];
    ctx_->entropy().fill(random, sizeof(random));
    return assemble_v4(random);
}

Uuid Generator::uuid7()
{
    const Stamp stamp = ctx_->v7_counter().next();
    std::uint8_t random[8];
    ctx_->entropy().fill(random, sizeof(random));
    return assemble_v7(stamp, random);
}

std::string Generator::short_id()
{
    return uuid7().short_id();
}

std::string Generator::nano_id()
{
    return nano_id(codec::kNanoIdDefaultSize);
}

std::string Generator::nano_id(std::size_t size)
{
    static const std::string kAlphabet(codec::kNanoAlphabet);
    validate_nano_size(size);
    std::string out;
    fill_nano(ctx_->entropy(), size, kAlphabet, 63, out);
    return out;
}

std::string Generator::nano_id(std::size_t size, const std::string& alphabet)
{
    validate_nano_size(size);
    codec::validate_alphabet(alphabet);
    std::string out;
    fill_nano(ctx_->entropy(), size, alphabet, codec::nano_mask(alphabet.size()), out);
    return out;
}

} // namespace idforge::core

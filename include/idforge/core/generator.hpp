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
 * @file generator.hpp
 * @brief Single-value generators for every identifier family.
 *
 * @details
 * A `Generator` is a thin, copyable view over a `GenerationContext`. Each call
 * runs entirely on the caller's thread and produces exactly one identifier.
 * The static `assemble_*` functions lay out raw UUID bytes and are shared with
 * the batch engine.
 */

#pragma once

#include "idforge/core/codec.hpp"
#include "idforge/core/context.hpp"
#include "idforge/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace idforge::core {

class Generator {
  public:
    explicit Generator(GenerationContext& context) : ctx_(&context) {}

    /**
     * @brief Time-based UUID (version 1).
     *
     * The 60-bit timestamp counts 100 ns intervals since 1582-10-15 and is taken
     * from the context's v1 counter, so successive values never repeat or regress.
     *
     * @throws ClockUnavailable, EntropyUnavailable (first call only).
     */
    Uuid uuid1();

    /// @brief Random UUID (version 4). @throws EntropyUnavailable
    Uuid uuid4();

    /**
     * @brief Time-ordered UUID (version 7).
     *
     * Layout: 48-bit Unix milliseconds, version, 16-bit monotonic sequence
     * (12 bits of rand_a plus the first 4 bits of rand_b), variant, 58 random bits.
     *
     * @throws ClockUnavailable, EntropyUnavailable
     */
    Uuid uuid7();

    /// @brief 16-character URL-safe rendering of the first 12 bytes of a fresh v7.
    std::string short_id();

    /// @brief 21-character nano id over the default alphabet.
    std::string nano_id();

    /// @throws InvalidArgument unless 1 <= @p size <= 1024.
    std::string nano_id(std::size_t size);

    /// @throws InvalidArgument on a bad size or alphabet (see `codec::validate_alphabet`).
    std::string nano_id(std::size_t size, const std::string& alphabet);

    static Uuid assemble_v1(std::uint64_t gregorian_100ns, const V1Node& node);
    static Uuid assemble_v4(const std::uint8_t* random16);
    static Uuid assemble_v7(const Stamp& stamp, const std::uint8_t* random8);

    /// @brief Gregorian 100 ns timestamp for a v1 counter stamp.
    static std::uint64_t v1_timestamp(const Stamp& stamp);

    /// @brief Checks a nano id size. @throws InvalidArgument
    static void validate_nano_size(std::size_t size);

    /**
     * @brief Appends one nano id of @p size symbols to an empty @p out.
     *
     * Draws entropy in blocks sized to the expected rejection rate and keeps
     * drawing until enough bytes have been accepted.
     */
    static void fill_nano(EntropySource& entropy, std::size_t size, const std::string& alphabet,
                          std::uint8_t mask, std::string& out);

  private:
    GenerationContext* ctx_;
};

} // namespace idforge::core

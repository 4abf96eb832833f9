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
 * @file context.hpp
 * @brief The shared state every generator draws from.
 *
 * @details
 * A `GenerationContext` bundles the entropy source, the wall clock and the two
 * monotonic counters used by time-based families. Generators and the batch
 * engine receive it by reference; only the public facade (`idforge.hpp`) owns a
 * process-wide instance. Tests build their own context around fakes.
 */

#pragma once

#include "idforge/core/clock.hpp"
#include "idforge/core/entropy.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace idforge::core {

/**
 * @struct V1Node
 * @brief Node identifier and clock sequence embedded in every v1 UUID of a process.
 */
struct V1Node {
    std::uint64_t node = 0;      ///< 48 bits, multicast bit set (random node).
    std::uint16_t clock_seq = 0; ///< 14 bits.
};

class GenerationContext {
  public:
    /// @brief v1 counter tick: one microsecond, split into ten 100 ns slots.
    static constexpr std::uint64_t kV1TickNs = 1'000;
    static constexpr std::uint32_t kV1SequenceLimit = 10;

    /// @brief v7 counter tick: one millisecond with a 16-bit sequence.
    static constexpr std::uint64_t kV7TickNs = 1'000'000;
    static constexpr std::uint32_t kV7SequenceLimit = 65536;

    /**
     * @param entropy Random byte supplier. Must not be null.
     * @param clock Wall clock. Must not be null.
     * @throws InvalidArgument if either handle is null.
     */
    GenerationContext(std::shared_ptr<EntropySource> entropy, std::shared_ptr<Clock> clock);

    GenerationContext(const GenerationContext&) = delete;
    GenerationContext& operator=(const GenerationContext&) = delete;

    EntropySource& entropy() { return *entropy_; }
    Clock& clock() { return *clock_; }

    MonotonicCounter& v1_counter() { return v1_counter_; }
    MonotonicCounter& v7_counter() { return v7_counter_; }

    /**
     * @brief The v1 node and clock sequence, drawn from entropy on first use.
     *
     * Lock-free after initialisation. A forked child draws a fresh pair so its v1
     * identifiers cannot collide with the parent's.
     *
     * @throws EntropyUnavailable if the first draw fails.
     */
    V1Node v1_node();

  private:
    std::shared_ptr<EntropySource> entropy_;
    std::shared_ptr<Clock> clock_;
    MonotonicCounter v1_counter_;
    MonotonicCounter v7_counter_;

    /// Packed node: bit 63 valid flag, bits 48..61 clock sequence, bits 0..47 node.
    std::atomic<std::uint64_t> v1_node_{0};
    std::atomic<std::uint64_t> v1_node_generation_{0};
};

} // namespace idforge::core

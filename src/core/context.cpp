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

#include "idforge/core/context.hpp"

#include "idforge/core/error.hpp"

#include <utility>

namespace idforge::core {

namespace {

constexpr std::uint64_t kNodeValid = 1ULL << 63;
constexpr std::uint64_t kNodeMask = 0xFFFFFFFFFFFFULL;
// Least significant bit of the first node octet (RFC 4122 section 4.5).
constexpr std::uint64_t kMulticastBit = 1ULL << 40;

const std::shared_ptr<Clock>& require_clock(const std::shared_ptr<Clock>& clock)
{
    if (!clock) {
        throw InvalidArgument("Generation context requires a clock");
    }
    return clock;
}

} // namespace

GenerationContext::GenerationContext(std::shared_ptr<EntropySource> entropy,
                                     std::shared_ptr<Clock> clock)
    : entropy_(std::move(entropy)),
      clock_(require_clock(clock)),
      v1_counter_(*clock_, kV1TickNs, kV1SequenceLimit),
      v7_counter_(*clock_, kV7TickNs, kV7SequenceLimit)
{
    if (!entropy_) {
        throw InvalidArgument("Generation context requires an entropy source");
    }
}

V1Node GenerationContext::v1_node()
{
    const std::uint64_t generation = fork_generation();
    if (v1_node_generation_.load(std::memory_order_acquire) != generation) {
        // Only reachable in a freshly forked, single-threaded child.
        v1_node_.store(0, std::memory_order_release);
        v1_node_generation_.store(generation, std::memory_order_release);
    }

    std::uint64_t packed = v1_node_.load(std::memory_order_acquire);
    if ((packed & kNodeValid) == 0) {
        std::uint8_t raw[8];
        entropy_->fill(raw, sizeof(raw));

        std::uint64_t node = 0;
        for (int i = 0; i < 6; ++i) {
            node = (node << 8) | raw[i];
        }
        node |= kMulticastBit;
        const std::uint64_t clock_seq = ((static_cast<std::uint64_t>(raw[6]) << 8) | raw[7]) & 0x3FFF;
        const std::uint64_t fresh = kNodeValid | (clock_seq << 48) | node;

        // The first thread to publish wins; losers adopt its value.
        if (v1_node_.compare_exchange_strong(packed, fresh, std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
            packed = fresh;
        }
    }

    return V1Node{packed & kNodeMask, static_cast<std::uint16_t>((packed >> 48) & 0x3FFF)};
}

} // namespace idforge::core

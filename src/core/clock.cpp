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
 * @file clock.cpp
 * @brief Implementation of the system clock and the monotonic counter.
 */

#include "idforge/core/clock.hpp"

#include "idforge/core/error.hpp"
#include "idforge/infra/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>
#include <thread>

namespace idforge::core {

std::uint64_t SystemClock::now_ns()
{
    struct timespec ts;
    if (::clock_gettime(CLOCK_REALTIME, &ts) != 0) {
        throw ClockUnavailable(std::string("clock_gettime failed: ") + std::strerror(errno));
    }
    if (ts.tv_sec < 0) {
        throw ClockUnavailable("System clock reports a time before the Unix epoch");
    }
    return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
           static_cast<std::uint64_t>(ts.tv_nsec);
}

namespace {

/// Bits needed to store the values 0..limit inclusive.
unsigned bits_for(std::uint32_t limit)
{
    unsigned bits = 0;
    while ((static_cast<std::uint64_t>(1) << bits) <= limit) {
        ++bits;
    }
    return bits;
}

} // namespace

MonotonicCounter::MonotonicCounter(Clock& clock, std::uint64_t tick_ns,
                                   std::uint32_t sequence_limit)
    : clock_(clock),
      tick_ns_(tick_ns),
      limit_(sequence_limit),
      sequence_bits_(bits_for(sequence_limit)),
      sequence_mask_((static_cast<std::uint64_t>(1) << bits_for(sequence_limit)) - 1)
{
    if (tick_ns == 0) {
        throw InvalidArgument("Monotonic counter tick must be positive");
    }
    if (sequence_limit == 0 || sequence_limit > 65536) {
        throw InvalidArgument("Monotonic counter sequence limit must be in 1..65536");
    }
}

std::uint64_t MonotonicCounter::current_tick()
{
    return clock_.now_ns() / tick_ns_;
}

void MonotonicCounter::note_rollback(std::uint64_t now, std::uint64_t stored)
{
    if (!behind_.exchange(true, std::memory_order_relaxed)) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Clock: wall clock moved backwards by " +
                               std::to_string(stored - now) +
                               " tick(s); holding last timestamp until it catches up.");
    }
}

Stamp MonotonicCounter::next()
{
    return reserve(1).at(0);
}

StampRange MonotonicCounter::reserve(std::uint32_t n)
{
    if (n == 0) {
        throw InvalidArgument("Cannot reserve zero stamps");
    }

    std::uint64_t prev = state_.load(std::memory_order_acquire);
    while (true) {
        const std::uint64_t now = current_tick();
        const std::uint64_t stored_tick = prev >> sequence_bits_;
        const auto next_free = static_cast<std::uint32_t>(prev & sequence_mask_);

        StampRange range;
        if (now > stored_tick) {
            if (behind_.load(std::memory_order_relaxed)) {
                behind_.store(false, std::memory_order_relaxed);
            }
            range.tick = now;
            range.first = 0;
            range.count = std::min(n, limit_);
        } else {
            if (now < stored_tick) {
                note_rollback(now, stored_tick);
            }
            if (next_free >= limit_) {
                // Tick exhausted: wait for real time to move past it.
                while (current_tick() <= stored_tick) {
                    std::this_thread::yield();
                }
                prev = state_.load(std::memory_order_acquire);
                continue;
            }
            range.tick = stored_tick;
            range.first = next_free;
            range.count = std::min(n, limit_ - next_free);
        }

        const std::uint64_t desired =
            (range.tick << sequence_bits_) | static_cast<std::uint64_t>(range.first + range.count);
        if (state_.compare_exchange_weak(prev, desired, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
            return range;
        }
    }
}

Stamp MonotonicCounter::last() const
{
    const std::uint64_t s = state_.load(std::memory_order_acquire);
    const auto next_free = static_cast<std::uint32_t>(s & sequence_mask_);
    return Stamp{s >> sequence_bits_, next_free == 0 ? 0 : next_free - 1};
}

} // namespace idforge::core

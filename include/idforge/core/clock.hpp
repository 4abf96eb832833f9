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
 * @file clock.hpp
 * @brief Wall clock abstraction and the lock-free monotonic (tick, sequence) counter.
 *
 * @details
 * Time-based identifiers (UUID v1, UUID v7, short ids) embed a timestamp and a
 * sequence number. `MonotonicCounter` guarantees that the pairs it hands out are
 * strictly increasing across all threads of the process, even when the wall
 * clock stalls or jumps backwards.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace idforge::core {

/**
 * @class Clock
 * @brief Source of wall-clock time.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /**
     * @brief Current Unix time in nanoseconds.
     * @throws ClockUnavailable if the time cannot be read.
     */
    virtual std::uint64_t now_ns() = 0;
};

/**
 * @class SystemClock
 * @brief `clock_gettime(CLOCK_REALTIME)`.
 */
class SystemClock : public Clock {
  public:
    std::uint64_t now_ns() override;
};

/**
 * @struct Stamp
 * @brief A single (tick, sequence) pair.
 */
struct Stamp {
    std::uint64_t tick = 0;
    std::uint32_t sequence = 0;

    bool operator<(const Stamp& o) const
    {
        return tick < o.tick || (tick == o.tick && sequence < o.sequence);
    }
    bool operator==(const Stamp& o) const { return tick == o.tick && sequence == o.sequence; }
};

/**
 * @struct StampRange
 * @brief `count` consecutive sequences `[first, first + count)` within one tick.
 */
struct StampRange {
    std::uint64_t tick = 0;
    std::uint32_t first = 0;
    std::uint32_t count = 0;

    Stamp at(std::uint32_t i) const { return Stamp{tick, first + i}; }
};

/**
 * @class MonotonicCounter
 * @brief Hands out strictly increasing (tick, sequence) pairs.
 *
 * @details
 * The whole state lives in one `std::atomic<uint64_t>`: the current tick in the
 * high bits and the next unused sequence in the low bits. Every operation is a
 * compare-and-swap loop, so the counter never takes a lock.
 *
 * **Rules:**
 * - Clock advanced past the stored tick: switch to the new tick, sequence restarts at 0.
 * - Same tick, or clock behind the stored tick (NTP step): keep the stored tick and
 *   continue its sequence. The pair never regresses.
 * - Sequence space of the tick exhausted: yield-spin until the wall clock passes the
 *   stored tick, then restart.
 */
class MonotonicCounter {
  public:
    /**
     * @param clock Wall clock. Must outlive the counter.
     * @param tick_ns Length of one tick in nanoseconds (e.g. 1'000'000 for milliseconds).
     * @param sequence_limit Number of distinct sequences per tick (1..65536).
     * @throws InvalidArgument on a zero tick or an out-of-range limit.
     */
    MonotonicCounter(Clock& clock, std::uint64_t tick_ns, std::uint32_t sequence_limit);

    MonotonicCounter(const MonotonicCounter&) = delete;
    MonotonicCounter& operator=(const MonotonicCounter&) = delete;

    /// @brief Returns the next pair. Equivalent to `reserve(1).at(0)`.
    Stamp next();

    /**
     * @brief Atomically reserves up to @p n consecutive sequences within one tick.
     *
     * The returned range holds at least one and at most @p n stamps. Callers that
     * need more loop until satisfied; each call is one CAS on the shared state.
     *
     * @param n Requested count, must be positive.
     */
    StampRange reserve(std::uint32_t n);

    /// @brief The most recently reserved pair, or {0, 0} before the first call.
    Stamp last() const;

    std::uint64_t tick_ns() const { return tick_ns_; }
    std::uint32_t sequence_limit() const { return limit_; }

  private:
    std::uint64_t current_tick();
    void note_rollback(std::uint64_t now, std::uint64_t stored);

    Clock& clock_;
    const std::uint64_t tick_ns_;
    const std::uint32_t limit_;
    const unsigned sequence_bits_;
    const std::uint64_t sequence_mask_;

    std::atomic<std::uint64_t> state_{0};
    std::atomic<bool> behind_{false};
};

} // namespace idforge::core

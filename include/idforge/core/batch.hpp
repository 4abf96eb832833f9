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
 * @file batch.hpp
 * @brief Parallel batch generation on a reusable worker pool.
 *
 * @details
 * A batch of N identifiers is split by the `Partitioner` into contiguous
 * chunks. Each chunk writes only its own slots of a preallocated output vector
 * and draws its own entropy and counter ranges, so workers share no per-item
 * state and need no per-item locking. The batch is all-or-nothing: if any chunk
 * fails, the first failure is rethrown and nothing is returned.
 *
 * **Batch Flow:**
 * 1. Validate `count` (negative or above `max_batch_size` is rejected).
 * 2. `count == 0`: return an empty vector without touching entropy or clocks.
 * 3. Plan chunks, submit all but the first to the pool, run the first inline.
 * 4. Await every chunk, then rethrow the first error or return the vector.
 */

#pragma once

#include "idforge/core/codec.hpp"
#include "idforge/core/context.hpp"
#include "idforge/core/identifier.hpp"
#include "idforge/core/uuid.hpp"
#include "idforge/infra/scheduler.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace idforge::core {

/**
 * @struct BatchOptions
 * @brief Tuning knobs fixed when a `BatchEngine` is built.
 */
struct BatchOptions {
    /// Worker threads in the pool; 0 selects the number of logical cores.
    std::size_t worker_threads = 0;

    /// Smallest chunk worth handing to a separate worker.
    std::size_t min_chunk_size = 1024;

    /// Largest accepted `count`.
    std::int64_t max_batch_size = 100'000'000;

    /// Nano id length used by `generate(Family::NanoId, ...)`.
    std::size_t nano_id_size = codec::kNanoIdDefaultSize;
};

/**
 * @struct Chunk
 * @brief The half-open slot range `[offset, offset + length)` of one work item.
 */
struct Chunk {
    std::size_t offset = 0;
    std::size_t length = 0;
};

class Partitioner {
  public:
    /**
     * @brief Splits @p count items into contiguous, non-overlapping chunks.
     *
     * The worker count is bounded by @p workers and by `ceil(count / min_chunk)`,
     * so small batches never fan out wider than they have items. Chunks have
     * length `ceil(count / worker_count)` except possibly the last.
     *
     * @return An empty plan for `count == 0`; otherwise chunks covering `[0, count)`.
     */
    static std::vector<Chunk> plan(std::size_t count, std::size_t workers, std::size_t min_chunk);
};

/**
 * @class BatchEngine
 * @brief Produces large batches of identifiers in parallel.
 *
 * @details
 * The engine owns a `infra::Scheduler` sized at construction and reuses it for
 * every call. It is safe to call from many threads at once; concurrent batches
 * simply interleave their chunks on the shared pool.
 *
 * The pool's threads do not exist in a child created by `fork()`. An engine
 * inherited that way runs every chunk on the calling thread and never touches
 * the parent's pool again.
 */
class BatchEngine {
  public:
    /**
     * @param context Shared generation state. Must outlive the engine.
     * @param options Pool size and batch limits.
     * @throws InvalidArgument if `min_chunk_size` is 0 or `max_batch_size` is negative.
     */
    explicit BatchEngine(GenerationContext& context, BatchOptions options = {});
    ~BatchEngine();

    BatchEngine(const BatchEngine&) = delete;
    BatchEngine& operator=(const BatchEngine&) = delete;

    /**
     * @brief Family-generic batch.
     * @throws InvalidArgument, EntropyUnavailable, ClockUnavailable
     */
    std::vector<Identifier> generate(Family family, std::int64_t count);

    std::vector<Uuid> uuid1_batch(std::int64_t count);
    std::vector<Uuid> uuid4_batch(std::int64_t count);
    std::vector<Uuid> uuid7_batch(std::int64_t count);
    std::vector<std::string> short_id_batch(std::int64_t count);

    /// @brief Nano ids of @p size symbols over @p alphabet.
    std::vector<std::string> nano_id_batch(std::int64_t count,
                                           std::size_t size = codec::kNanoIdDefaultSize,
                                           const std::string& alphabet = codec::kNanoAlphabet);

    /// @brief Workers available to this process; 1 in a forked child.
    std::size_t worker_count() const { return forked() ? 1 : pool_->size(); }
    const BatchOptions& options() const { return options_; }

  private:
    /// True once the process is no longer the one that built the pool.
    bool forked() const { return fork_generation() != generation_; }

    std::size_t checked_count(std::int64_t count) const;

    /// Runs @p fill over every chunk of a @p count sized output.
    template <typename T, typename Fill> std::vector<T> run(std::size_t count, Fill fill);

    void fill_uuid1(Uuid* out, std::size_t n);
    void fill_uuid4(Uuid* out, std::size_t n);
    void fill_uuid7(Uuid* out, std::size_t n);

    GenerationContext& ctx_;
    BatchOptions options_;
    std::uint64_t generation_;
    std::unique_ptr<infra::Scheduler> pool_;
};

} // namespace idforge::core

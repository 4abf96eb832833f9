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
 * @file entropy.hpp
 * @brief Cryptographically secure random byte supply.
 *
 * @details
 * `EntropySource` is the seam through which every random bit enters the engine.
 * Production code uses `SystemEntropySource`, which draws from the kernel CSPRNG;
 * tests substitute deterministic or failing implementations.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace idforge::core {

/**
 * @class EntropySource
 * @brief Abstract supplier of random bytes.
 *
 * Implementations must be safe to call concurrently from any number of threads
 * without external locking, and must throw `EntropyUnavailable` instead of
 * returning weak or partial output.
 */
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    /**
     * @brief Fills @p out with @p n random bytes.
     * @throws EntropyUnavailable if the underlying source fails.
     */
    virtual void fill(std::uint8_t* out, std::size_t n) = 0;

    /// @brief Convenience wrapper returning @p n fresh random bytes.
    std::vector<std::uint8_t> next_bytes(std::size_t n);
};

/**
 * @class SystemEntropySource
 * @brief Kernel CSPRNG (`getrandom(2)`) behind a per-thread refill buffer.
 *
 * @details
 * Small requests are served from a thread-local buffer refilled in one system
 * call, so concurrent generators never contend on a lock. Requests at least as
 * large as the buffer go straight to the kernel. Buffers are discarded in a
 * forked child so parent and child never hand out the same bytes.
 */
class SystemEntropySource : public EntropySource {
  public:
    /// @brief Size of each thread's refill buffer in bytes.
    static constexpr std::size_t kBufferSize = 512;

    void fill(std::uint8_t* out, std::size_t n) override;

  private:
    static void read_kernel(std::uint8_t* out, std::size_t n);
};

/**
 * @brief Counter incremented in every child process created by `fork()`.
 *
 * State derived from entropy (per-thread buffers, the v1 node identifier) records
 * the generation it was created in and is rebuilt when the value changes.
 */
std::uint64_t fork_generation();

} // namespace idforge::core

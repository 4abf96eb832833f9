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
 * @file entropy.cpp
 * @brief Kernel-backed entropy source.
 */

#include "idforge/core/entropy.hpp"

#include "idforge/core/error.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <pthread.h>
#include <string>
#include <sys/random.h>
#include <sys/types.h>

namespace idforge::core {

namespace {

std::atomic<std::uint64_t> g_fork_generation{0};

void on_fork_child()
{
    g_fork_generation.fetch_add(1, std::memory_order_relaxed);
}

void install_fork_handler()
{
    static std::once_flag once;
    std::call_once(once, [] { ::pthread_atfork(nullptr, nullptr, &on_fork_child); });
}

/// Per-thread unread window of kernel bytes.
struct ThreadBuffer {
    std::uint8_t data[SystemEntropySource::kBufferSize];
    std::size_t pos = SystemEntropySource::kBufferSize;
    std::uint64_t generation = 0;
};

} // namespace

std::uint64_t fork_generation()
{
    install_fork_handler();
    return g_fork_generation.load(std::memory_order_relaxed);
}

std::vector<std::uint8_t> EntropySource::next_bytes(std::size_t n)
{
    std::vector<std::uint8_t> out(n);
    if (n > 0) {
        fill(out.data(), n);
    }
    return out;
}

void SystemEntropySource::read_kernel(std::uint8_t* out, std::size_t n)
{
    std::size_t done = 0;
    while (done < n) {
        ssize_t got = ::getrandom(out + done, n - done, 0);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw EntropyUnavailable(std::string("getrandom failed: ") + std::strerror(errno));
        }
        done += static_cast<std::size_t>(got);
    }
}

void SystemEntropySource::fill(std::uint8_t* out, std::size_t n)
{
    if (n >= kBufferSize) {
        read_kernel(out, n);
        return;
    }

    static thread_local ThreadBuffer buffer;

    const std::uint64_t generation = fork_generation();
    if (buffer.generation != generation) {
        buffer.pos = kBufferSize;
        buffer.generation = generation;
    }

    while (n > 0) {
        if (buffer.pos == kBufferSize) {
            read_kernel(buffer.data, kBufferSize);
            buffer.pos = 0;
        }
        std::size_t take = std::min(n, kBufferSize - buffer.pos);
        std::memcpy(out, buffer.data + buffer.pos, take);
        // Served bytes are wiped so they cannot be handed out twice.
        std::memset(buffer.data + buffer.pos, 0, take);
        buffer.pos += take;
        out += take;
        n -= take;
    }
}

} // namespace idforge::core

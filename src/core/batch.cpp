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
 * @file batch.cpp
 * @brief Chunk planning, pool dispatch and the per-family chunk fillers.
 */

#include "idforge/core/batch.hpp"

#include "idforge/core/error.hpp"
#include "idforge/core/generator.hpp"
#include "idforge/infra/logger.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <limits>

namespace idforge::core {

namespace {

/// Identifiers assembled per entropy draw inside a chunk.
constexpr std::size_t kBlock = 256;

std::uint32_t clamp_u32(std::size_t n)
{
    return static_cast<std::uint32_t>(
        std::min<std::size_t>(n, std::numeric_limits<std::uint32_t>::max()));
}

} // namespace

std::vector<Chunk> Partitioner::plan(std::size_t count, std::size_t workers, std::size_t min_chunk)
{
    std::vector<Chunk> chunks;
    if (count == 0) {
        return chunks;
    }

    const std::size_t by_size = (count + min_chunk - 1) / std::max<std::size_t>(min_chunk, 1);
    const std::size_t worker_count = std::max<std::size_t>(1, std::min(workers, by_size));
    const std::size_t chunk = (count + worker_count - 1) / worker_count;

    chunks.reserve(worker_count);
    for (std::size_t offset = 0; offset < count; offset += chunk) {
        chunks.push_back(Chunk{offset, std::min(chunk, count - offset)});
    }
    return chunks;
}

BatchEngine::BatchEngine(GenerationContext& context, BatchOptions options)
    : ctx_(context), options_(options), generation_(fork_generation()),
      pool_(std::make_unique<infra::Scheduler>(options.worker_threads))
{
    if (options_.min_chunk_size == 0) {
        throw InvalidArgument("min_chunk_size must be positive");
    }
    if (options_.max_batch_size < 0) {
        throw InvalidArgument("max_batch_size must not be negative");
    }
    Generator::validate_nano_size(options_.nano_id_size);

    infra::Logger::log(infra::LogLevel::INFO,
                       "BatchEngine: pool of " + std::to_string(pool_->size()) +
                           " workers, min chunk " + std::to_string(options_.min_chunk_size) + ".");
}

BatchEngine::~BatchEngine()
{
    // The workers live only in the parent; joining them from a child never returns.
    if (forked()) {
        static_cast<void>(pool_.release());
    }
}

std::size_t BatchEngine::checked_count(std::int64_t count) const
{
    if (count < 0) {
        throw InvalidArgument("Batch count must not be negative, got " + std::to_string(count));
    }
    if (count > options_.max_batch_size) {
        throw InvalidArgument("Batch count " + std::to_string(count) + " exceeds the limit of " +
                              std::to_string(options_.max_batch_size));
    }
    return static_cast<std::size_t>(count);
}

template <typename T, typename Fill> std::vector<T> BatchEngine::run(std::size_t count, Fill fill)
{
    std::vector<T> out(count);
    const std::vector<Chunk> chunks =
        Partitioner::plan(count, worker_count(), options_.min_chunk_size);

    if (infra::Logger::enabled(infra::LogLevel::TRACE)) {
        infra::Logger::log(infra::LogLevel::TRACE,
                           "BatchEngine: " + std::to_string(count) + " items in " +
                               std::to_string(chunks.size()) + " chunk(s).");
    }

    if (chunks.size() <= 1) {
        if (!chunks.empty()) {
            fill(out.data(), count);
        }
        return out;
    }

    std::vector<std::future<void>> pending;
    pending.reserve(chunks.size() - 1);
    for (std::size_t i = 1; i < chunks.size(); ++i) {
        T* slot = out.data() + chunks[i].offset;
        const std::size_t length = chunks[i].length;
        pending.push_back(pool_->submit([fill, slot, length]() mutable { fill(slot, length); }));
    }

    // The caller works on the first chunk instead of idling.
    std::exception_ptr first_error;
    try {
        fill(out.data(), chunks[0].length);
    } catch (...) {
        first_error = std::current_exception();
    }

    // Every chunk must finish before `out` can be released or returned.
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "BatchEngine: batch of " + std::to_string(count) + " aborted.");
        std::rethrow_exception(first_error);
    }
    return out;
}

void BatchEngine::fill_uuid1(Uuid* out, std::size_t n)
{
    const V1Node node = ctx_.v1_node();
    MonotonicCounter& counter = ctx_.v1_counter();

    std::size_t done = 0;
    while (done < n) {
        const StampRange range = counter.reserve(clamp_u32(n - done));
        for (std::uint32_t i = 0; i < range.count; ++i) {
            out[done + i] = Generator::assemble_v1(Generator::v1_timestamp(range.at(i)), node);
        }
        done += range.count;
    }
}

void BatchEngine::fill_uuid4(Uuid* out, std::size_t n)
{
    std::uint8_t random[kBlock * 16];
    EntropySource& entropy = ctx_.entropy();

    for (std::size_t done = 0; done < n;) {
        const std::size_t k = std::min(kBlock, n - done);
        entropy.fill(random, k * 16);
        for (std::size_t i = 0; i < k; ++i) {
            out[done + i] = Generator::assemble_v4(random + i * 16);
        }
        done += k;
    }
}

void BatchEngine::fill_uuid7(Uuid* out, std::size_t n)
{
    std::uint8_t random[kBlock * 8];
    EntropySource& entropy = ctx_.entropy();
    MonotonicCounter& counter = ctx_.v7_counter();

    std::size_t done = 0;
    while (done < n) {
        const StampRange range = counter.reserve(clamp_u32(std::min(kBlock, n - done)));
        entropy.fill(random, range.count * 8);
        for (std::uint32_t i = 0; i < range.count; ++i) {
            out[done + i] = Generator::assemble_v7(range.at(i), random + i * 8);
        }
        done += range.count;
    }
}

std::vector<Uuid> BatchEngine::uuid1_batch(std::int64_t count)
{
    const std::size_t n = checked_count(count);
    if (n == 0) {
        return {};
    }
    return run<Uuid>(n, [this](Uuid* out, std::size_t len) { fill_uuid1(out, len); });
}

std::vector<Uuid> BatchEngine::uuid4_batch(std::int64_t count)
{
    const std::size_t n = checked_count(count);
    if (n == 0) {
        return {};
    }
    return run<Uuid>(n, [this](Uuid* out, std::size_t len) { fill_uuid4(out, len); });
}

std::vector<Uuid> BatchEngine::uuid7_batch(std::int64_t count)
{
    const std::size_t n = checked_count(count);
    if (n == 0) {
        return {};
    }
    return run<Uuid>(n, [this](Uuid* out, std::size_t len) { fill_uuid7(out, len); });
}

std::vector<std::string> BatchEngine::short_id_batch(std::int64_t count)
{
    const std::size_t n = checked_count(count);
    if (n == 0) {
        return {};
    }
    return run<std::string>(n, [this](std::string* out, std::size_t len) {
        Uuid block[kBlock];
        for (std::size_t done = 0; done < len;) {
            const std::size_t k = std::min(kBlock, len - done);
            fill_uuid7(block, k);
            for (std::size_t i = 0; i < k; ++i) {
                out[done + i] = block[i].short_id();
            }
            done += k;
        }
    });
}

std::vector<std::string> BatchEngine::nano_id_batch(std::int64_t count, std::size_t size,
                                                    const std::string& alphabet)
{
    Generator::validate_nano_size(size);
    codec::validate_alphabet(alphabet);
    const std::size_t n = checked_count(count);
    if (n == 0) {
        return {};
    }

    const std::uint8_t mask = codec::nano_mask(alphabet.size());
    return run<std::string>(n, [this, size, mask, &alphabet](std::string* out, std::size_t len) {
        EntropySource& entropy = ctx_.entropy();
        for (std::size_t i = 0; i < len; ++i) {
            Generator::fill_nano(entropy, size, alphabet, mask, out[i]);
        }
    });
}

std::vector<Identifier> BatchEngine::generate(Family family, std::int64_t count)
{
    std::vector<Identifier> result;

    switch (family) {
    case Family::Uuid1:
    case Family::Uuid4:
    case Family::Uuid7: {
        std::vector<Uuid> ids = family == Family::Uuid1   ? uuid1_batch(count)
                                : family == Family::Uuid4 ? uuid4_batch(count)
                                                          : uuid7_batch(count);
        result.reserve(ids.size());
        for (const Uuid& u : ids) {
            result.emplace_back(family, u);
        }
        break;
    }
    case Family::ShortId:
    case Family::NanoId: {
        std::vector<std::string> ids = family == Family::ShortId
                                           ? short_id_batch(count)
                                           : nano_id_batch(count, options_.nano_id_size);
        result.reserve(ids.size());
        for (std::string& s : ids) {
            result.emplace_back(family, std::move(s));
        }
        break;
    }
    }
    return result;
}

} // namespace idforge::core

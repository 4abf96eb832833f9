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
 * @file idforge.cpp
 * @brief Process-wide defaults behind the public entry points.
 */

#include "idforge/idforge.hpp"

#include "idforge/core/generator.hpp"
#include "idforge/infra/logger.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace idforge {

namespace {

std::mutex g_config_mutex;
config::Config g_config;
bool g_engine_created = false;

// Read on every single-value call, so kept outside the mutex.
std::atomic<std::size_t> g_nano_id_size{core::codec::kNanoIdDefaultSize};

core::BatchOptions claim_options()
{
    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_engine_created = true;
    return g_config.batch_options();
}

} // namespace

void configure(const config::Config& config)
{
    std::lock_guard<std::mutex> lock(g_config_mutex);
    if (g_engine_created) {
        throw core::InvalidArgument("configure() must be called before the first batch");
    }
    g_config = config;
    g_nano_id_size.store(config.nano_id_size, std::memory_order_relaxed);
    infra::Logger::set_level(config.log_level);
}

core::GenerationContext& default_context()
{
    static core::GenerationContext context(std::make_shared<core::SystemEntropySource>(),
                                           std::make_shared<core::SystemClock>());
    return context;
}

core::BatchEngine& default_engine()
{
    static core::BatchEngine engine(default_context(), claim_options());
    return engine;
}

Uuid uuid1()
{
    return core::Generator(default_context()).uuid1();
}

Uuid uuid4()
{
    return core::Generator(default_context()).uuid4();
}

Uuid uuid7()
{
    return core::Generator(default_context()).uuid7();
}

std::string short_id()
{
    return core::Generator(default_context()).short_id();
}

std::string nano_id()
{
    return nano_id(g_nano_id_size.load(std::memory_order_relaxed));
}

std::string nano_id(std::size_t size)
{
    return core::Generator(default_context()).nano_id(size);
}

std::vector<Uuid> uuid1_batch(std::int64_t count)
{
    return default_engine().uuid1_batch(count);
}

std::vector<Uuid> uuid4_batch(std::int64_t count)
{
    return default_engine().uuid4_batch(count);
}

std::vector<Uuid> uuid7_batch(std::int64_t count)
{
    return default_engine().uuid7_batch(count);
}

std::vector<std::string> short_id_batch(std::int64_t count)
{
    return default_engine().short_id_batch(count);
}

std::vector<std::string> nano_id_batch(std::int64_t count)
{
    return default_engine().nano_id_batch(count, default_engine().options().nano_id_size);
}

std::vector<std::string> nano_id_batch(std::int64_t count, std::size_t size,
                                       const std::string& alphabet)
{
    return default_engine().nano_id_batch(count, size, alphabet);
}

std::vector<Identifier> generate_batch(Family family, std::int64_t count)
{
    return default_engine().generate(family, count);
}

} // namespace idforge

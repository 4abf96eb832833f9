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
 * @file idforge.hpp
 * @brief Public entry points over the process-wide generation context.
 *
 * @details
 * This is the boundary consumed by host wrappers. The default context
 * (kernel entropy, system clock) and the default batch engine are created
 * lazily on first use and live until process exit. Code that needs explicit
 * control, such as tests with fake clocks, builds its own
 * `core::GenerationContext` and `core::BatchEngine` instead.
 *
 * @code
 * #include <idforge/idforge.hpp>
 *
 * std::string id = idforge::uuid7().to_string();
 * std::vector<std::string> keys = idforge::nano_id_batch(10'000);
 * @endcode
 */

#pragma once

#include "idforge/config/config.hpp"
#include "idforge/core/batch.hpp"
#include "idforge/core/codec.hpp"
#include "idforge/core/context.hpp"
#include "idforge/core/error.hpp"
#include "idforge/core/identifier.hpp"
#include "idforge/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace idforge {

using core::Family;
using core::Identifier;
using core::Uuid;

/**
 * @brief Applies @p config to the default engine and the logger.
 *
 * Must run before the first batch call, because the worker pool is sized when
 * the default engine is created.
 *
 * @throws core::InvalidArgument if the default engine already exists.
 */
void configure(const config::Config& config);

/// @brief The lazily created process-wide context.
core::GenerationContext& default_context();

/// @brief The lazily created process-wide batch engine.
core::BatchEngine& default_engine();

Uuid uuid1();
Uuid uuid4();
Uuid uuid7();
std::string short_id();

/// @brief Nano id of the configured `nano_id_size` (21 unless `configure()` changed it).
std::string nano_id();
std::string nano_id(std::size_t size);

std::vector<Uuid> uuid1_batch(std::int64_t count);
std::vector<Uuid> uuid4_batch(std::int64_t count);
std::vector<Uuid> uuid7_batch(std::int64_t count);
std::vector<std::string> short_id_batch(std::int64_t count);

/// @brief @p count nano ids of the configured `nano_id_size`.
std::vector<std::string> nano_id_batch(std::int64_t count);
std::vector<std::string> nano_id_batch(std::int64_t count, std::size_t size,
                                       const std::string& alphabet = core::codec::kNanoAlphabet);

std::vector<Identifier> generate_batch(Family family, std::int64_t count);

} // namespace idforge

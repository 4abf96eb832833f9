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
 * @file config.hpp
 * @brief Engine configuration and its JSON representation.
 *
 * @details
 * A configuration file is a flat JSON object:
 *
 * @code
 * {
 *   "worker_threads": 8,
 *   "min_chunk_size": 1024,
 *   "max_batch_size": 100000000,
 *   "nano_id_size": 21,
 *   "log_level": "info"
 * }
 * @endcode
 *
 * Every key is optional; unknown keys are ignored.
 */

#pragma once

#include "idforge/core/batch.hpp"
#include "idforge/infra/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace idforge::config {

struct Config {
    std::size_t worker_threads = 0;
    std::size_t min_chunk_size = 1024;
    std::int64_t max_batch_size = 100'000'000;
    std::size_t nano_id_size = 21;
    infra::LogLevel log_level = infra::LogLevel::INFO;

    /**
     * @brief Parses a JSON document, starting from the defaults.
     * @throws core::InvalidArgument on malformed JSON, a wrong value type or a value
     * out of range.
     */
    static Config from_json(const std::string& json);

    /**
     * @brief Reads and parses a configuration file.
     * @throws core::InvalidArgument if the file cannot be read or parsed.
     */
    static Config load_file(const std::string& path);

    /// @brief Compact JSON rendering of every field.
    std::string to_json() const;

    /// @brief Options for a `core::BatchEngine`.
    core::BatchOptions batch_options() const;
};

} // namespace idforge::config

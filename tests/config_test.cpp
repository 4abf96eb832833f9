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
 * @file config_test.cpp
 * @brief Unit tests for JSON configuration loading.
 */

#include "framework.hpp"
#include "idforge/config/config.hpp"
#include "idforge/core/error.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using idforge::config::Config;
using idforge::core::InvalidArgument;
using idforge::infra::LogLevel;

/// An empty object yields the built-in defaults.
void test_config_defaults()
{
    const Config cfg = Config::from_json("{}");
    ASSERT_EQ(cfg.worker_threads, static_cast<size_t>(0));
    ASSERT_EQ(cfg.min_chunk_size, static_cast<size_t>(1024));
    ASSERT_EQ(cfg.max_batch_size, static_cast<std::int64_t>(100'000'000));
    ASSERT_EQ(cfg.nano_id_size, static_cast<size_t>(21));
    ASSERT_TRUE(cfg.log_level == LogLevel::INFO);
}

void test_config_overrides()
{
    const Config cfg = Config::from_json(R"({
        "worker_threads": 6,
        "min_chunk_size": 256,
        "max_batch_size": 5000,
        "nano_id_size": 32,
        "log_level": "debug"
    })");

    ASSERT_EQ(cfg.worker_threads, static_cast<size_t>(6));
    ASSERT_EQ(cfg.min_chunk_size, static_cast<size_t>(256));
    ASSERT_EQ(cfg.max_batch_size, static_cast<std::int64_t>(5000));
    ASSERT_EQ(cfg.nano_id_size, static_cast<size_t>(32));
    ASSERT_TRUE(cfg.log_level == LogLevel::DEBUG);

    const idforge::core::BatchOptions options = cfg.batch_options();
    ASSERT_EQ(options.worker_threads, static_cast<size_t>(6));
    ASSERT_EQ(options.min_chunk_size, static_cast<size_t>(256));
    ASSERT_EQ(options.max_batch_size, static_cast<std::int64_t>(5000));
    ASSERT_EQ(options.nano_id_size, static_cast<size_t>(32));
}

/**
 * @brief Malformed documents and out-of-range values are rejected.
 *
 * Scenarios verified:
 * - Broken syntax and non-object roots.
 * - Wrong types, fractions and values outside the accepted range.
 * - Unknown log level names.
 */
void test_config_rejects_invalid()
{
    ASSERT_THROWS(Config::from_json("{"), InvalidArgument);
    ASSERT_THROWS(Config::from_json("[1, 2]"), InvalidArgument);
    ASSERT_THROWS(Config::from_json(R"({"worker_threads": "four"})"), InvalidArgument);
    ASSERT_THROWS(Config::from_json(R"({"worker_threads": -1})"), InvalidArgument);
    ASSERT_THROWS(Config::from_json(R"({"min_chunk_size": 0})"), InvalidArgument);
    ASSERT_THROWS(Config::from_json(R"({"min_chunk_size": 12.5})"), InvalidArgument);
    ASSERT_THROWS(Config::from_json(R"({"nano_id_size": 1025})"), InvalidArgument);
    ASSERT_THROWS(Config::from_json(R"({"log_level": "chatty"})"), InvalidArgument);
    ASSERT_THROWS(Config::from_json(R"({"log_level": 3})"), InvalidArgument);
}

/// Rendering then re-parsing reproduces the same settings.
void test_config_to_json()
{
    Config cfg;
    cfg.worker_threads = 3;
    cfg.nano_id_size = 10;
    cfg.log_level = LogLevel::WARN;

    const Config back = Config::from_json(cfg.to_json());
    ASSERT_EQ(back.worker_threads, static_cast<size_t>(3));
    ASSERT_EQ(back.nano_id_size, static_cast<size_t>(10));
    ASSERT_TRUE(back.log_level == LogLevel::WARN);
}

void test_config_load_file()
{
    const std::string path = "idforge_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"min_chunk_size": 512})";
    }

    const Config cfg = Config::load_file(path);
    std::remove(path.c_str());
    ASSERT_EQ(cfg.min_chunk_size, static_cast<size_t>(512));

    ASSERT_THROWS(Config::load_file("does/not/exist.json"), InvalidArgument);
}

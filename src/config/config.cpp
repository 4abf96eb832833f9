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
 * @file config.cpp
 * @brief cJSON-backed parsing and rendering of `Config`.
 */

#include "idforge/config/config.hpp"

#include "idforge/core/codec.hpp"
#include "idforge/core/error.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace idforge::config {

namespace {

/// Owns a parsed cJSON tree for the duration of a parse.
class JsonDoc {
  public:
    explicit JsonDoc(cJSON* root) : root_(root) {}
    ~JsonDoc() { cJSON_Delete(root_); }

    JsonDoc(const JsonDoc&) = delete;
    JsonDoc& operator=(const JsonDoc&) = delete;

    cJSON* get() const { return root_; }

  private:
    cJSON* root_;
};

/// Reads an optional integral field within [lo, hi].
std::int64_t read_integer(const cJSON* root, const char* key, std::int64_t lo, std::int64_t hi,
                          std::int64_t fallback)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return fallback;
    }
    if (!cJSON_IsNumber(item)) {
        throw core::InvalidArgument(std::string("Config key '") + key + "' must be a number");
    }

    const double v = item->valuedouble;
    if (std::floor(v) != v || v < static_cast<double>(lo) || v > static_cast<double>(hi)) {
        throw core::InvalidArgument(std::string("Config key '") + key + "' must be an integer in " +
                                    std::to_string(lo) + ".." + std::to_string(hi));
    }
    return static_cast<std::int64_t>(v);
}

} // namespace

Config Config::from_json(const std::string& json)
{
    JsonDoc doc(cJSON_Parse(json.c_str()));
    if (!doc.get()) {
        throw core::InvalidArgument("Invalid JSON syntax in configuration");
    }
    if (!cJSON_IsObject(doc.get())) {
        throw core::InvalidArgument("Configuration must be a JSON object");
    }

    const cJSON* root = doc.get();
    Config cfg;

    cfg.worker_threads = static_cast<std::size_t>(
        read_integer(root, "worker_threads", 0, 1024, static_cast<std::int64_t>(cfg.worker_threads)));
    cfg.min_chunk_size = static_cast<std::size_t>(read_integer(
        root, "min_chunk_size", 1, 1'000'000'000, static_cast<std::int64_t>(cfg.min_chunk_size)));
    cfg.max_batch_size =
        read_integer(root, "max_batch_size", 0, 1'000'000'000'000LL, cfg.max_batch_size);
    cfg.nano_id_size = static_cast<std::size_t>(
        read_integer(root, "nano_id_size", 1, static_cast<std::int64_t>(core::codec::kNanoIdMaxSize),
                     static_cast<std::int64_t>(cfg.nano_id_size)));

    const cJSON* level = cJSON_GetObjectItemCaseSensitive(root, "log_level");
    if (level) {
        if (!cJSON_IsString(level) || !level->valuestring) {
            throw core::InvalidArgument("Config key 'log_level' must be a string");
        }
        cfg.log_level = infra::Logger::parse_level(level->valuestring);
    }

    return cfg;
}

Config Config::load_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw core::InvalidArgument("Cannot open configuration file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

std::string Config::to_json() const
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddNumberToObject(root, "worker_threads", static_cast<double>(worker_threads));
    cJSON_AddNumberToObject(root, "min_chunk_size", static_cast<double>(min_chunk_size));
    cJSON_AddNumberToObject(root, "max_batch_size", static_cast<double>(max_batch_size));
    cJSON_AddNumberToObject(root, "nano_id_size", static_cast<double>(nano_id_size));
    cJSON_AddStringToObject(root, "log_level", infra::Logger::level_name(log_level));

    char* raw = cJSON_PrintUnformatted(root);
    std::string out = raw ? std::string(raw) : std::string("{}");

    free(raw);
    cJSON_Delete(root);
    return out;
}

core::BatchOptions Config::batch_options() const
{
    core::BatchOptions options;
    options.worker_threads = worker_threads;
    options.min_chunk_size = min_chunk_size;
    options.max_batch_size = max_batch_size;
    options.nano_id_size = nano_id_size;
    return options;
}

} // namespace idforge::config

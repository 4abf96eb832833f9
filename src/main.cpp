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
 * @file main.cpp
 * @brief Command-line entry point.
 *
 * @details
 * 1. Argument Parsing (configuration file first, then flag overrides).
 * 2. Engine Configuration.
 * 3. Generation, or the `--serve` request loop.
 */

#include "idforge/idforge.hpp"
#include "idforge/infra/logger.hpp"
#include "idforge/infra/string.hpp"
#include "idforge/service/handler.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct Options {
    std::string family = "uuid4";
    std::int64_t count = 1;
    std::optional<std::int64_t> size;
    std::optional<std::string> alphabet;
    std::optional<std::int64_t> threads;
    std::optional<std::string> log_level;
    std::string config_path;
    bool json = false;
    bool serve = false;
    bool help = false;
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --family F      uuid1 | uuid4 | uuid7 | short_id | nano_id (Default: uuid4)\n"
              << "  --count N       Number of identifiers to generate (Default: 1)\n"
              << "  --size N        Nano id length (Default: 21)\n"
              << "  --alphabet A    Custom nano id alphabet\n"
              << "  --json          Print a JSON array instead of one id per line\n"
              << "  --threads N     Worker threads for batches (Default: logical cores)\n"
              << "  --config FILE   JSON configuration file\n"
              << "  --log-level L   trace | debug | info | warn | error | fatal\n"
              << "  --serve         Answer JSON requests read line by line from stdin\n"
              << "  --help          Show this help message\n";
}

Options parse_args(int argc, char* argv[])
{
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw idforge::core::InvalidArgument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--family") {
            opts.family = value();
        } else if (arg == "--count" || arg == "-n") {
            opts.count = idforge::infra::String::parse_int(value());
        } else if (arg == "--size") {
            opts.size = idforge::infra::String::parse_int(value());
        } else if (arg == "--alphabet") {
            opts.alphabet = value();
        } else if (arg == "--threads") {
            opts.threads = idforge::infra::String::parse_int(value());
        } else if (arg == "--config") {
            opts.config_path = value();
        } else if (arg == "--log-level") {
            opts.log_level = value();
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--serve") {
            opts.serve = true;
        } else {
            throw idforge::core::InvalidArgument("Unknown option '" + arg + "'");
        }
    }
    return opts;
}

idforge::config::Config build_config(const Options& opts)
{
    idforge::config::Config cfg;
    if (!opts.config_path.empty()) {
        cfg = idforge::config::Config::load_file(opts.config_path);
    }
    if (opts.threads) {
        if (*opts.threads < 0) {
            throw idforge::core::InvalidArgument("--threads must not be negative");
        }
        cfg.worker_threads = static_cast<std::size_t>(*opts.threads);
    }
    if (opts.log_level) {
        cfg.log_level = idforge::infra::Logger::parse_level(*opts.log_level);
    }
    return cfg;
}

std::vector<std::string> generate(const Options& opts, const idforge::config::Config& cfg)
{
    const idforge::Family family = idforge::core::parse_family(opts.family);

    if (family == idforge::Family::NanoId) {
        const std::int64_t size = opts.size ? *opts.size : static_cast<std::int64_t>(cfg.nano_id_size);
        if (size <= 0) {
            throw idforge::core::InvalidArgument("--size must be positive");
        }
        return idforge::nano_id_batch(opts.count, static_cast<std::size_t>(size),
                                      opts.alphabet ? *opts.alphabet
                                                    : std::string(idforge::core::codec::kNanoAlphabet));
    }

    std::vector<std::string> out;
    for (const idforge::Identifier& id : idforge::generate_batch(family, opts.count)) {
        out.push_back(id.to_string());
    }
    return out;
}

void print_json(const std::vector<std::string>& ids)
{
    cJSON* arr = cJSON_CreateArray();
    for (const std::string& id : ids) {
        cJSON_AddItemToArray(arr, cJSON_CreateString(id.c_str()));
    }
    char* raw = cJSON_PrintUnformatted(arr);
    if (raw) {
        std::cout << raw << '\n';
    }
    free(raw);
    cJSON_Delete(arr);
}

} // namespace

int main(int argc, char* argv[])
{
    using idforge::infra::Logger;
    using idforge::infra::LogLevel;

    // stdout carries identifiers only.
    Logger::redirect_to_stderr(true);

    try {
        const Options opts = parse_args(argc, argv);
        if (opts.help) {
            print_help(argv[0]);
            return 0;
        }

        const idforge::config::Config cfg = build_config(opts);
        idforge::configure(cfg);
        Logger::log(LogLevel::DEBUG, "Config: " + cfg.to_json());

        if (opts.serve) {
            Logger::log(LogLevel::INFO, "Service: reading JSON requests from stdin.");
            std::size_t handled = idforge::service::serve(idforge::default_engine(), std::cin, std::cout);
            Logger::log(LogLevel::INFO,
                        "Service: " + std::to_string(handled) + " request(s) handled. Goodbye.");
            return 0;
        }

        const std::vector<std::string> ids = generate(opts, cfg);
        if (opts.json) {
            print_json(ids);
        } else {
            for (const std::string& id : ids) {
                std::cout << id << '\n';
            }
        }
        std::cout.flush();

    } catch (const idforge::core::Error& e) {
        Logger::log(LogLevel::FATAL, e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

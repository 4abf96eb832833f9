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
 * @file handler.cpp
 * @brief Implementation of the JSON request pipeline.
 *
 * @details
 * 1. **Ingest**: Parse the raw JSON line.
 * 2. **Decode**: Resolve the action to an identifier family and read its arguments.
 * 3. **Execute**: Run the batch on the engine.
 * 4. **Respond**: Serialize the identifiers or the error.
 */

#include "idforge/service/handler.hpp"

#include "idforge/core/error.hpp"
#include "idforge/core/identifier.hpp"
#include "idforge/infra/logger.hpp"
#include "idforge/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <limits>
#include <ostream>

namespace idforge::service {

namespace {

std::string error_response(const std::string& kind, const std::string& message)
{
    cJSON* resp = cJSON_CreateObject();
    cJSON_AddStringToObject(resp, "status", "error");
    cJSON_AddStringToObject(resp, "kind", kind.c_str());
    cJSON_AddStringToObject(resp, "message", message.c_str());

    char* raw = cJSON_PrintUnformatted(resp);
    std::string out(raw ? raw : "{\"status\":\"error\"}");
    free(raw);
    cJSON_Delete(resp);
    return out;
}

/// Reads an optional non-negative integral argument.
std::int64_t integer_arg(const cJSON* req, const char* key, std::int64_t fallback)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!item) {
        return fallback;
    }
    if (!cJSON_IsNumber(item)) {
        throw core::InvalidArgument(std::string("'") + key + "' must be an integer");
    }

    // [-2^63, 2^63): every double in this range converts to int64 exactly.
    constexpr double kLow = static_cast<double>(std::numeric_limits<std::int64_t>::min());
    const double v = item->valuedouble;
    if (!std::isfinite(v) || std::floor(v) != v || v < kLow || v >= -kLow) {
        throw core::InvalidArgument(std::string("'") + key + "' must be an integer in the int64 range");
    }
    return static_cast<std::int64_t>(v);
}

} // namespace

std::string Handler::process(core::BatchEngine& engine, const std::string& raw_json)
{
    if (infra::String::trim(raw_json).empty()) {
        return error_response("InvalidArgument", "Empty request payload");
    }

    cJSON* req = cJSON_Parse(raw_json.c_str());
    if (!req) {
        return error_response("InvalidArgument", "Invalid JSON syntax");
    }

    const cJSON* act = cJSON_GetObjectItemCaseSensitive(req, "action");
    const std::string action = (cJSON_IsString(act) && act->valuestring) ? act->valuestring : "";

    if (action == "ping") {
        cJSON_Delete(req);
        return "{\"status\":\"ok\",\"message\":\"pong\"}";
    }
    if (action == "exit") {
        cJSON_Delete(req);
        return "{\"status\":\"goodbye\",\"message\":\"Closing session\"}";
    }

    cJSON* resp = cJSON_CreateObject();
    std::string final_response;

    try {
        const core::Family family = core::parse_family(action);
        const std::int64_t count = integer_arg(req, "count", 1);

        cJSON* ids = cJSON_CreateArray();
        cJSON_AddStringToObject(resp, "status", "ok");
        cJSON_AddStringToObject(resp, "family", core::to_string(family));
        cJSON_AddNumberToObject(resp, "count", static_cast<double>(count));
        // Ownership Transfer: 'ids' becomes a child of 'resp'.
        cJSON_AddItemToObject(resp, "ids", ids);

        if (family == core::Family::NanoId) {
            const std::int64_t size = integer_arg(
                req, "size", static_cast<std::int64_t>(engine.options().nano_id_size));
            if (size <= 0) {
                throw core::InvalidArgument("'size' must be positive");
            }
            const cJSON* alpha = cJSON_GetObjectItemCaseSensitive(req, "alphabet");
            std::string alphabet = core::codec::kNanoAlphabet;
            if (alpha) {
                if (!cJSON_IsString(alpha) || !alpha->valuestring) {
                    throw core::InvalidArgument("'alphabet' must be a string");
                }
                alphabet = alpha->valuestring;
            }
            for (const std::string& id :
                 engine.nano_id_batch(count, static_cast<std::size_t>(size), alphabet)) {
                cJSON_AddItemToArray(ids, cJSON_CreateString(id.c_str()));
            }
        } else {
            for (const core::Identifier& id : engine.generate(family, count)) {
                cJSON_AddItemToArray(ids, cJSON_CreateString(id.to_string().c_str()));
            }
        }

        char* raw_output = cJSON_PrintUnformatted(resp);
        final_response = raw_output ? std::string(raw_output) : std::string();
        free(raw_output);
    } catch (const core::Error& e) {
        infra::Logger::log(infra::LogLevel::ERROR, std::string("Handler: ") + e.what());
        final_response = error_response(core::to_string(e.kind()), e.what());
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR, std::string("Handler: ") + e.what());
        final_response = error_response("Internal", e.what());
    }

    cJSON_Delete(resp);
    cJSON_Delete(req);

    if (final_response.empty()) {
        final_response = error_response("Internal", "Response serialization failed");
    }
    return final_response;
}

std::size_t serve(core::BatchEngine& engine, std::istream& in, std::ostream& out)
{
    std::size_t handled = 0;
    std::string line;

    while (std::getline(in, line)) {
        if (infra::String::trim(line).empty()) {
            continue;
        }

        const std::string resp = Handler::process(engine, line);
        out << resp << '\n' << std::flush;
        ++handled;

        if (resp.find("\"status\":\"goodbye\"") != std::string::npos) {
            infra::Logger::log(infra::LogLevel::INFO, "Service: client requested exit.");
            break;
        }
    }
    return handled;
}

} // namespace idforge::service

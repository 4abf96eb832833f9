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
 * @file handler.hpp
 * @brief JSON request dispatcher for line-oriented host integration.
 *
 * @details
 * A host process that cannot link the library directly runs `idforge --serve`
 * as a co-process and exchanges one JSON object per line. `Handler` decodes a
 * request, runs it on the batch engine and encodes the response; `serve` is the
 * read-dispatch-write loop around it.
 */

#pragma once

#include "idforge/core/batch.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace idforge::service {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 */
class Handler {
  public:
    /**
     * @brief Processes one raw request and returns the serialized response.
     *
     * Errors never escape as exceptions; they are reported in the response.
     *
     * **Response Formats:**
     * - **Success:** `{"status":"ok","count":N,"ids":[...]}`
     * - **Error:** `{"status":"error","kind":"InvalidArgument","message":"..."}`
     * - **Exit:** `{"status":"goodbye","message":"Closing session"}`
     *
     * @code
     * // Example Request Payloads:
     * {"action": "uuid7", "count": 3}
     * {"action": "nano_id", "count": 2, "size": 10, "alphabet": "0123456789abcdef"}
     * {"action": "ping"}
     * @endcode
     */
    static std::string process(core::BatchEngine& engine, const std::string& raw_json);
};

/**
 * @brief Answers each non-blank line of @p in on @p out until EOF or an `exit` request.
 * @return The number of requests processed.
 */
std::size_t serve(core::BatchEngine& engine, std::istream& in, std::ostream& out);

} // namespace idforge::service

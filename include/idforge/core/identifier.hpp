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
 * @file identifier.hpp
 * @brief Family tag and the family-tagged identifier returned by generic batches.
 */

#pragma once

#include "idforge/core/uuid.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace idforge::core {

/**
 * @enum Family
 * @brief The identifier schemes produced by the engine.
 */
enum class Family { Uuid1, Uuid4, Uuid7, ShortId, NanoId };

/// @brief Stable lower-case name: "uuid1", "uuid4", "uuid7", "short_id", "nano_id".
const char* to_string(Family family);

/**
 * @brief Inverse of `to_string(Family)`. Also accepts "shortid" and "nanoid".
 * @throws InvalidArgument on an unknown name.
 */
Family parse_family(const std::string& name);

/// @brief True for the three UUID families.
inline bool is_uuid_family(Family family)
{
    return family == Family::Uuid1 || family == Family::Uuid4 || family == Family::Uuid7;
}

/**
 * @class Identifier
 * @brief An immutable identifier of any family.
 *
 * UUID families hold a `Uuid`; short ids and nano ids hold their fixed-length text.
 */
class Identifier {
  public:
    Identifier(Family family, const Uuid& uuid) : family_(family), value_(uuid) {}
    Identifier(Family family, std::string text) : family_(family), value_(std::move(text)) {}

    Family family() const { return family_; }

    bool is_uuid() const { return std::holds_alternative<Uuid>(value_); }

    /// @throws InvalidArgument when the identifier is not a UUID.
    const Uuid& uuid() const;

    /// @brief Canonical text form.
    std::string to_string() const;

    /**
     * @brief Raw bytes: 16 for UUIDs, the 12 decoded bytes for a short id, and the
     * ASCII symbols themselves for a nano id.
     */
    std::vector<std::uint8_t> bytes() const;

    bool operator==(const Identifier& o) const
    {
        return family_ == o.family_ && value_ == o.value_;
    }
    bool operator!=(const Identifier& o) const { return !(*this == o); }

  private:
    Family family_;
    std::variant<Uuid, std::string> value_;
};

} // namespace idforge::core

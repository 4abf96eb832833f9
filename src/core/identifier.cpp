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

#include "idforge/core/identifier.hpp"

#include "idforge/core/codec.hpp"
#include "idforge/core/error.hpp"
#include "idforge/infra/string.hpp"

namespace idforge::core {

const char* to_string(Family family)
{
    switch (family) {
    case Family::Uuid1:
        return "uuid1";
    case Family::Uuid4:
        return "uuid4";
    case Family::Uuid7:
        return "uuid7";
    case Family::ShortId:
        return "short_id";
    case Family::NanoId:
        return "nano_id";
    }
    return "unknown";
}

Family parse_family(const std::string& name)
{
    const std::string key = infra::String::to_lower(infra::String::trim(name));
    if (key == "uuid1")
        return Family::Uuid1;
    if (key == "uuid4")
        return Family::Uuid4;
    if (key == "uuid7")
        return Family::Uuid7;
    if (key == "short_id" || key == "shortid")
        return Family::ShortId;
    if (key == "nano_id" || key == "nanoid")
        return Family::NanoId;
    throw InvalidArgument("Unknown identifier family '" + name + "'");
}

const Uuid& Identifier::uuid() const
{
    if (const Uuid* u = std::get_if<Uuid>(&value_)) {
        return *u;
    }
    throw InvalidArgument(std::string(core::to_string(family_)) + " is not a UUID family");
}

std::string Identifier::to_string() const
{
    if (const Uuid* u = std::get_if<Uuid>(&value_)) {
        return u->to_string();
    }
    return std::get<std::string>(value_);
}

std::vector<std::uint8_t> Identifier::bytes() const
{
    if (const Uuid* u = std::get_if<Uuid>(&value_)) {
        return std::vector<std::uint8_t>(u->bytes().begin(), u->bytes().end());
    }
    const std::string& text = std::get<std::string>(value_);
    if (family_ == Family::ShortId) {
        return codec::base64url_decode(text);
    }
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace idforge::core

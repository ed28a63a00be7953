/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/cli/Inspection.hpp"

#include "ksuid/common/constants.hpp"

#include <date/date.h>
#include <date/tz.h>

//-------------------------------------------------------------------------

namespace ksuid::cli
{

//-------------------------------------------------------------------------

namespace
{

inline constexpr const char* kTimeFormat = "%a, %d %b %Y %T %Z";

}  // namespace

//-------------------------------------------------------------------------

Inspection::Inspection(Ksuid id, bool utc) noexcept
    : m_id{id}, m_utc{utc}
{}

//-------------------------------------------------------------------------

std::string Inspection::formattedTime() const
{
    if (m_utc) {
        return date::format(kTimeFormat, m_id.time());
    }
    return date::format(kTimeFormat, date::make_zoned(date::current_zone(), m_id.time()));
}

//-------------------------------------------------------------------------

std::string Inspection::payloadHex() const
{
    return m_id.toHex().substr(2 * kTimestampLength);
}

//-------------------------------------------------------------------------

void Inspection::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "string", rapidjson::Value{m_id.toBase62().c_str(), allocator}, allocator);
        json.AddMember("raw", rapidjson::Value{m_id.toHex().c_str(), allocator}, allocator);
        json.AddMember("time", rapidjson::Value{formattedTime().c_str(), allocator}, allocator);
        json.AddMember("timestamp", rapidjson::Value{m_id.timestamp()}, allocator);
        json.AddMember("payload", rapidjson::Value{payloadHex().c_str(), allocator}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace ksuid::cli

//-------------------------------------------------------------------------

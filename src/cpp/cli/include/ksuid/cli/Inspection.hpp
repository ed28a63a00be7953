/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/core/Ksuid.hpp"
#include "ksuid/serialization/JsonSerializable.hpp"

#include <fmt/format.h>

#include <string>

//-------------------------------------------------------------------------

namespace ksuid::cli
{

//-------------------------------------------------------------------------

/**
 * Breakdown of a single id into its representations and components, as
 * printed by `ksuid inspect`.
 */
class Inspection : public json::JsonSerializable
{
public:
    explicit Inspection(Ksuid id, bool utc = false) noexcept;

    [[nodiscard]] const Ksuid& id() const noexcept { return m_id; }
    [[nodiscard]] bool utc() const noexcept { return m_utc; }

    // RFC 822 style, in the local time zone unless utc() is set.
    [[nodiscard]] std::string formattedTime() const;

    // Hex digits of the payload bytes only.
    [[nodiscard]] std::string payloadHex() const;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    Ksuid m_id;
    bool m_utc;
};

//-------------------------------------------------------------------------

}  // namespace ksuid::cli

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<ksuid::cli::Inspection>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const ksuid::cli::Inspection& inspection, FormatContext& ctx) const
    {
        const auto& id = inspection.id();
        return fmt::format_to(
            ctx.out(),
            "\n"
            "REPRESENTATION:\n"
            "\n"
            "  String: {}\n"
            "     Raw: {:x}\n"
            "\n"
            "COMPONENTS:\n"
            "\n"
            "       Time: {}\n"
            "  Timestamp: {}\n"
            "    Payload: {}\n",
            id,
            id,
            inspection.formattedTime(),
            id.timestamp(),
            inspection.payloadHex());
    }
};

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/common/Error.hpp"
#include "ksuid/common/constants.hpp"

#include <fmt/format.h>

#include <bit>
#include <chrono>
#include <compare>
#include <functional>
#include <span>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid
{

//-------------------------------------------------------------------------

class PayloadSource;

/**
 * K-sortable unique identifier.
 *
 * Layout, big-endian: a 4-byte timestamp counting seconds since the KSUID
 * epoch, followed by a 16-byte payload. Comparison is byte-lexicographic over
 * all 20 bytes, so ids order by time first and payload second, and their
 * Base62 and Hex renderings sort the same way.
 */
class Ksuid
{
public:
    constexpr Ksuid() noexcept = default;
    Ksuid(uint32_t timestamp, const Payload& payload) noexcept;

    [[nodiscard]] static constexpr Ksuid nil() noexcept { return Ksuid{}; }

    [[nodiscard]] static constexpr Ksuid max() noexcept
    {
        Ksuid id;
        id.m_bytes.fill(0xFF);
        return id;
    }

    [[nodiscard]] static Expected<Ksuid> withPayload(const Payload& payload);
    [[nodiscard]] static Expected<Ksuid> withPayload(
        const Payload& payload, std::chrono::sys_seconds now);

    // Uses a thread-local RandomPayloadSource.
    [[nodiscard]] static Expected<Ksuid> generate();
    [[nodiscard]] static Expected<Ksuid> generate(PayloadSource& source);

    [[nodiscard]] static Expected<Ksuid> fromBase62(std::string_view str);
    [[nodiscard]] static Expected<Ksuid> fromHex(std::string_view str);
    [[nodiscard]] static Expected<Ksuid> fromBytes(std::span<const uint8_t> raw);

    [[nodiscard]] std::string toBase62() const;
    [[nodiscard]] std::string toHex() const;

    [[nodiscard]] std::span<const uint8_t, kByteLength> bytes() const noexcept { return m_bytes; }

    [[nodiscard]] uint32_t timestamp() const noexcept;
    void setTimestamp(uint32_t timestamp) noexcept;

    [[nodiscard]] Payload payload() const noexcept;
    void setPayload(const Payload& payload) noexcept;

    [[nodiscard]] std::chrono::sys_seconds time() const noexcept;
    [[nodiscard]] Expected<void> setTime(std::chrono::sys_seconds time);

    friend constexpr auto operator<=>(const Ksuid&, const Ksuid&) noexcept = default;
    friend constexpr bool operator==(const Ksuid&, const Ksuid&) noexcept = default;

private:
    Bytes m_bytes{};
};

static_assert(sizeof(Ksuid) == kByteLength);

//-------------------------------------------------------------------------

[[nodiscard]] Expected<uint32_t> timestampFromTime(std::chrono::sys_seconds time);

//-------------------------------------------------------------------------

}  // namespace ksuid

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<ksuid::Ksuid>
{
    bool hex = false;

    constexpr auto parse(fmt::format_parse_context& ctx)
    {
        auto it = ctx.begin();
        if (it != ctx.end() && *it == 'x') {
            hex = true;
            ++it;
        }
        if (it != ctx.end() && *it != '}') {
            throw fmt::format_error{"invalid format for ksuid::Ksuid"};
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const ksuid::Ksuid& id, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", hex ? id.toHex() : id.toBase62());
    }
};

template<>
struct std::hash<ksuid::Ksuid>
{
    size_t operator()(const ksuid::Ksuid& id) const noexcept
    {
        const auto bytes = id.bytes();
        return std::hash<std::string_view>{}(
            std::string_view{std::bit_cast<const char*>(bytes.data()), bytes.size()});
    }
};

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid
{

//-------------------------------------------------------------------------

enum class ErrorCode : uint32_t
{
    INVALID_LENGTH,
    INVALID_CHARACTER,
    VALUE_TOO_LARGE,
    BUFFER_TOO_SMALL,
    TIMESTAMP_OUT_OF_RANGE
};

[[nodiscard]] constexpr std::string_view ErrorCode2StrView(ErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

//-------------------------------------------------------------------------

struct Error
{
    ErrorCode code;
    std::string message;

    [[nodiscard]] static Error invalidLength(
        std::string_view what, size_t expected, size_t actual);
    [[nodiscard]] static Error invalidCharacter(
        std::string_view what, uint8_t c, size_t position);
    [[nodiscard]] static Error valueTooLarge(std::string_view what);
    [[nodiscard]] static Error bufferTooSmall(size_t capacity);
    [[nodiscard]] static Error timestampOutOfRange(int64_t unixSeconds);
};

template<typename T>
using Expected = std::expected<T, Error>;

//-------------------------------------------------------------------------

class Exception : public std::runtime_error
{
public:
    explicit Exception(Error error);

    [[nodiscard]] const Error& error() const noexcept { return m_error; }

private:
    Error m_error;
};

//-------------------------------------------------------------------------

}  // namespace ksuid

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<ksuid::ErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(ksuid::ErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", ksuid::ErrorCode2StrView(ec));
    }
};

template<>
struct fmt::formatter<ksuid::Error>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const ksuid::Error& error, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}: {}", error.code, error.message);
    }
};

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/common/Error.hpp"
#include "ksuid/common/constants.hpp"

#include <span>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid::codec::hex
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kDigits{"0123456789ABCDEF"};

[[nodiscard]] constexpr int8_t charToNibble(uint8_t c) noexcept
{
    if (c >= '0' && c <= '9') return static_cast<int8_t>(c - '0');
    if (c >= 'A' && c <= 'F') return static_cast<int8_t>(c - 'A' + 10);
    if (c >= 'a' && c <= 'f') return static_cast<int8_t>(c - 'a' + 10);
    return -1;
}

// Always uppercase, 40 characters.
[[nodiscard]] std::string encode(std::span<const uint8_t, kByteLength> raw);

// Accepts either case. Length is checked before any character is looked at.
[[nodiscard]] Expected<Bytes> decode(std::string_view str);

//-------------------------------------------------------------------------

}  // namespace ksuid::codec::hex

//-------------------------------------------------------------------------

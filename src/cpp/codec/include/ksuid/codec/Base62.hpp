/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/common/Error.hpp"
#include "ksuid/common/constants.hpp"

#include <array>
#include <span>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid::codec::base62
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kBase = 62;

inline constexpr std::string_view kAlphabet{
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"};

static_assert(kAlphabet.size() == kBase);

inline constexpr int8_t kInvalidDigit = -1;

// Every byte value, ASCII or not, maps to its digit or to kInvalidDigit.
inline constexpr std::array<int8_t, 256> kDigitTable = [] {
    std::array<int8_t, 256> table{};
    table.fill(kInvalidDigit);
    for (size_t i = 0; i < kAlphabet.size(); ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}();

[[nodiscard]] constexpr int8_t charToDigit(uint8_t c) noexcept
{
    return kDigitTable[c];
}

[[nodiscard]] constexpr char digitToChar(uint8_t digit) noexcept
{
    return kAlphabet[digit];
}

//-------------------------------------------------------------------------

/**
 * Renders 20 bytes as exactly 27 Base62 characters. The input is copied
 * into a scratch buffer before conversion and is left untouched.
 */
[[nodiscard]] Expected<std::string> encode(std::span<const uint8_t, kByteLength> raw);

/**
 * Parses exactly 27 Base62 characters back into 20 bytes.
 * Characters are validated before any arithmetic runs.
 */
[[nodiscard]] Expected<Bytes> decode(std::string_view str);

//-------------------------------------------------------------------------

}  // namespace ksuid::codec::base62

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/codec/Hex.hpp"

//-------------------------------------------------------------------------

namespace ksuid::codec::hex
{

//-------------------------------------------------------------------------

std::string encode(std::span<const uint8_t, kByteLength> raw)
{
    std::string str;
    str.reserve(kHexLength);
    for (uint8_t b : raw) {
        str.push_back(kDigits[b >> 4]);
        str.push_back(kDigits[b & 0x0F]);
    }
    return str;
}

//-------------------------------------------------------------------------

Expected<Bytes> decode(std::string_view str)
{
    if (str.size() != kHexLength) {
        return std::unexpected{Error::invalidLength("Hex string", kHexLength, str.size())};
    }

    Bytes out;
    for (size_t i = 0; i < kByteLength; ++i) {
        const auto hi = static_cast<uint8_t>(str[2 * i]);
        const auto lo = static_cast<uint8_t>(str[2 * i + 1]);
        const int8_t upper = charToNibble(hi);
        if (upper < 0) {
            return std::unexpected{Error::invalidCharacter("hex", hi, 2 * i)};
        }
        const int8_t lower = charToNibble(lo);
        if (lower < 0) {
            return std::unexpected{Error::invalidCharacter("hex", lo, 2 * i + 1)};
        }
        out[i] = static_cast<uint8_t>(upper << 4 | lower);
    }
    return out;
}

//-------------------------------------------------------------------------

}  // namespace ksuid::codec::hex

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/codec/Base62.hpp"

#include "ksuid/codec/BaseConversion.hpp"

#include <algorithm>
#include <utility>

//-------------------------------------------------------------------------

namespace ksuid::codec::base62
{

//-------------------------------------------------------------------------

Expected<std::string> encode(std::span<const uint8_t, kByteLength> raw)
{
    Bytes scratch;
    std::ranges::copy(raw, scratch.begin());

    std::array<uint8_t, kBase62Length> digits;
    if (auto res = changeBase(scratch, digits, kMaxBase, kBase); !res) [[unlikely]] {
        return std::unexpected{std::move(res).error()};
    }

    std::string str(kBase62Length, '\0');
    std::ranges::transform(digits, str.begin(), digitToChar);
    return str;
}

//-------------------------------------------------------------------------

Expected<Bytes> decode(std::string_view str)
{
    if (str.size() != kBase62Length) {
        return std::unexpected{Error::invalidLength("Base62 string", kBase62Length, str.size())};
    }

    std::array<uint8_t, kBase62Length> scratch;
    for (size_t i = 0; i < str.size(); ++i) {
        const auto c = static_cast<uint8_t>(str[i]);
        const int8_t digit = charToDigit(c);
        if (digit == kInvalidDigit) {
            return std::unexpected{Error::invalidCharacter("Base62", c, i)};
        }
        scratch[i] = static_cast<uint8_t>(digit);
    }

    Bytes out;
    if (auto res = changeBase(scratch, out, kBase, kMaxBase); !res) {
        // Running out of room in a 20-byte target means the number itself is out of range.
        if (res.error().code == ErrorCode::BUFFER_TOO_SMALL) {
            return std::unexpected{Error::valueTooLarge(fmt::format("Base62 string '{}'", str))};
        }
        return std::unexpected{std::move(res).error()};
    }
    return out;
}

//-------------------------------------------------------------------------

}  // namespace ksuid::codec::base62

//-------------------------------------------------------------------------

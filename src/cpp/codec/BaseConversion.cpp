/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/codec/BaseConversion.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <source_location>

//-------------------------------------------------------------------------

namespace ksuid::codec
{

//-------------------------------------------------------------------------

namespace
{

void checkBase(uint32_t base, std::source_location sl = std::source_location::current())
{
    if (base < kMinBase || base > kMaxBase) [[unlikely]] {
        throw std::invalid_argument{fmt::format(
            "{}: base {} is outside [{}, {}]", sl.function_name(), base, kMinBase, kMaxBase)};
    }
}

}  // namespace

//-------------------------------------------------------------------------

size_t conversionLenBound(size_t len, uint32_t inBase, uint32_t outBase)
{
    checkBase(inBase);
    checkBase(outBase);
    const double digits =
        static_cast<double>(len) * (std::log(double(inBase)) / std::log(double(outBase)));
    return static_cast<size_t>(digits) + 1;
}

//-------------------------------------------------------------------------

Expected<void> changeBase(
    std::span<uint8_t> scratch, std::span<uint8_t> out, uint32_t inBase, uint32_t outBase)
{
    checkBase(inBase);
    checkBase(outBase);

    if (auto it = std::ranges::find_if(scratch, [inBase](uint8_t d) { return d >= inBase; });
        it != scratch.end()) [[unlikely]] {
        return std::unexpected{Error::invalidCharacter(
            fmt::format("base-{} digit", inBase),
            *it,
            static_cast<size_t>(std::distance(scratch.begin(), it)))};
    }

    std::ranges::fill(out, uint8_t{});

    // Grade-school long division. Each pass divides the number by outBase, storing
    // the quotient back into the front of scratch with its leading zeros dropped,
    // and emits the remainder as the next least significant output digit.
    size_t active = scratch.size();
    size_t k = out.size();

    while (active > 0) {
        uint32_t rem = 0;
        size_t next = 0;

        for (size_t j = 0; j < active; ++j) {
            const uint32_t acc = scratch[j] + inBase * rem;
            const uint32_t quotient = acc / outBase;
            rem = acc % outBase;
            if (next != 0 || quotient != 0) {
                scratch[next++] = static_cast<uint8_t>(quotient);
            }
        }

        if (k == 0) [[unlikely]] {
            return std::unexpected{Error::bufferTooSmall(out.size())};
        }
        out[--k] = static_cast<uint8_t>(rem);
        active = next;
    }

    return {};
}

//-------------------------------------------------------------------------

}  // namespace ksuid::codec

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/common/Error.hpp"

#include <cstdint>
#include <span>

//-------------------------------------------------------------------------

namespace ksuid::codec
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kMinBase = 2;
inline constexpr uint32_t kMaxBase = 256;

/**
 * Upper bound on the number of base-`outBase` digits needed to hold any
 * `len`-digit base-`inBase` number.
 */
[[nodiscard]] size_t conversionLenBound(size_t len, uint32_t inBase, uint32_t outBase);

/**
 * Converts the big-endian unsigned integer held in `scratch` (one base-`inBase`
 * digit per byte) to base `outBase`, writing the digits big-endian into `out`.
 *
 * `scratch` doubles as the long-division working area: its contents are
 * unspecified once the call returns. Pass a copy if the digits are still needed.
 *
 * `out` is zero-filled first, so positions not reached by the conversion read
 * as leading zeros. Fails with BUFFER_TOO_SMALL if the value needs more digits
 * than `out` holds, or with INVALID_CHARACTER if a digit of `scratch` is not
 * below `inBase`. Throws std::invalid_argument for bases outside [2, 256].
 */
[[nodiscard]] Expected<void> changeBase(
    std::span<uint8_t> scratch, std::span<uint8_t> out, uint32_t inBase, uint32_t outBase);

//-------------------------------------------------------------------------

}  // namespace ksuid::codec

//-------------------------------------------------------------------------

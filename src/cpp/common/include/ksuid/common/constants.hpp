/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid
{

//-------------------------------------------------------------------------

inline constexpr size_t kTimestampLength = 4;
inline constexpr size_t kPayloadLength = 16;
inline constexpr size_t kByteLength = kTimestampLength + kPayloadLength;
inline constexpr size_t kBase62Length = 27;
inline constexpr size_t kHexLength = 2 * kByteLength;

// Seconds between the UNIX epoch and the KSUID epoch.
inline constexpr int64_t kEpochSeconds = 1'400'000'000;

// Base62 rendering of twenty 0xFF bytes; no valid 27-char string sorts above it.
inline constexpr std::string_view kMaxBase62{"aWgEPTl1tmebfsQzFP4bxwgy80V"};

static_assert(kMaxBase62.size() == kBase62Length);

using Bytes = std::array<uint8_t, kByteLength>;
using Payload = std::array<uint8_t, kPayloadLength>;

//-------------------------------------------------------------------------

}  // namespace ksuid

//-------------------------------------------------------------------------

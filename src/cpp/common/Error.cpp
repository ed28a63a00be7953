/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/common/Error.hpp"

#include "ksuid/common/constants.hpp"

#include <limits>
#include <utility>

//-------------------------------------------------------------------------

namespace ksuid
{

//-------------------------------------------------------------------------

Error Error::invalidLength(std::string_view what, size_t expected, size_t actual)
{
    return Error{
        .code = ErrorCode::INVALID_LENGTH,
        .message = fmt::format("{} must be {} long, got {}", what, expected, actual)
    };
}

//-------------------------------------------------------------------------

Error Error::invalidCharacter(std::string_view what, uint8_t c, size_t position)
{
    return Error{
        .code = ErrorCode::INVALID_CHARACTER,
        .message = fmt::format("invalid {} character 0x{:02X} at position {}", what, c, position)
    };
}

//-------------------------------------------------------------------------

Error Error::valueTooLarge(std::string_view what)
{
    return Error{
        .code = ErrorCode::VALUE_TOO_LARGE,
        .message = fmt::format("{} exceeds the largest {}-byte value", what, kByteLength)
    };
}

//-------------------------------------------------------------------------

Error Error::bufferTooSmall(size_t capacity)
{
    return Error{
        .code = ErrorCode::BUFFER_TOO_SMALL,
        .message = fmt::format("conversion needs more than {} output digits", capacity)
    };
}

//-------------------------------------------------------------------------

Error Error::timestampOutOfRange(int64_t unixSeconds)
{
    return Error{
        .code = ErrorCode::TIMESTAMP_OUT_OF_RANGE,
        .message = fmt::format(
            "unix time {} is outside [{}, {}]",
            unixSeconds,
            kEpochSeconds,
            kEpochSeconds + static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
    };
}

//-------------------------------------------------------------------------

Exception::Exception(Error error)
    : std::runtime_error{fmt::format("{}", error)}, m_error{std::move(error)}
{}

//-------------------------------------------------------------------------

}  // namespace ksuid

//-------------------------------------------------------------------------

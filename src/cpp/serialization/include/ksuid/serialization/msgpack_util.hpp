/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <msgpack.hpp>

#include <concepts>
#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid::serialization
{

//-------------------------------------------------------------------------

// How a Ksuid is written into a PackStream.
enum class IdEncoding : uint8_t
{
    base62,
    hex,
    raw
};

// msgpack write target whose type selects the wire form of packed ids.
template<IdEncoding E>
class PackStream
{
public:
    static constexpr IdEncoding kEncoding = E;

    explicit PackStream(size_t initByteSize = MSGPACK_SBUFFER_INIT_SIZE)
        : m_buffer{initByteSize}
    {}

    [[nodiscard]] const char* data() const noexcept { return m_buffer.data(); }
    [[nodiscard]] size_t size() const noexcept { return m_buffer.size(); }
    [[nodiscard]] std::string_view view() const noexcept { return {data(), size()}; }

    void write(const char* buf, size_t len) { m_buffer.write(buf, len); }
    void clear() noexcept { m_buffer.clear(); }

private:
    msgpack::sbuffer m_buffer;
};

using HumanReadableStream = PackStream<IdEncoding::base62>;
using HexStream = PackStream<IdEncoding::hex>;
using BinaryStream = PackStream<IdEncoding::raw>;

template<typename Stream>
concept IdPackStream = std::same_as<Stream, PackStream<Stream::kEncoding>>;

//-------------------------------------------------------------------------

struct MsgPackError : msgpack::type_error
{
    std::string message;

    explicit MsgPackError(
        std::string_view detail = {},
        std::source_location sl = std::source_location::current()) noexcept
    {
        message = detail.empty()
            ? fmt::format("{}#L{}: {}", sl.file_name(), sl.line(), msgpack::type_error::what())
            : fmt::format(
                "{}#L{}: {}: {}", sl.file_name(), sl.line(), msgpack::type_error::what(), detail);
    }

    const char* what() const noexcept override { return message.c_str(); }
};

//-------------------------------------------------------------------------

}  // namespace ksuid::serialization

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/core/Ksuid.hpp"
#include "ksuid/serialization/msgpack_util.hpp"

#include <bit>
#include <concepts>

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct convert<ksuid::Ksuid>
{
    const msgpack::object& operator()(const msgpack::object& o, ksuid::Ksuid& v) const
    {
        auto parsed = [&]() -> ksuid::Expected<ksuid::Ksuid> {
            if (o.type == msgpack::type::BIN) {
                return ksuid::Ksuid::fromBytes(std::span{
                    std::bit_cast<const uint8_t*>(o.via.bin.ptr), o.via.bin.size});
            }
            else if (o.type == msgpack::type::STR) {
                const std::string_view str{o.via.str.ptr, o.via.str.size};
                return str.size() == ksuid::kHexLength
                    ? ksuid::Ksuid::fromHex(str)
                    : ksuid::Ksuid::fromBase62(str);
            }
            throw ksuid::serialization::MsgPackError{};
        }();
        if (!parsed) {
            throw ksuid::serialization::MsgPackError{fmt::format("{}", parsed.error())};
        }
        v = *parsed;
        return o;
    }
};

template<>
struct pack<ksuid::Ksuid>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const ksuid::Ksuid& v) const
    {
        using ksuid::serialization::IdEncoding;

        if constexpr (!ksuid::serialization::IdPackStream<Stream>) {
            static_assert(false, "Ksuid packs only into a serialization::PackStream");
        }
        else if constexpr (Stream::kEncoding == IdEncoding::raw) {
            const auto bytes = v.bytes();
            o.pack_bin(static_cast<uint32_t>(bytes.size()));
            o.pack_bin_body(
                std::bit_cast<const char*>(bytes.data()), static_cast<uint32_t>(bytes.size()));
        }
        else {
            const auto str = Stream::kEncoding == IdEncoding::hex ? v.toHex() : v.toBase62();
            o.pack_str(static_cast<uint32_t>(str.size()));
            o.pack_str_body(str.data(), static_cast<uint32_t>(str.size()));
        }
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/core/Ksuid.hpp"

#include "ksuid/codec/Base62.hpp"
#include "ksuid/codec/Hex.hpp"
#include "ksuid/core/Generator.hpp"

#include <algorithm>
#include <limits>
#include <utility>

//-------------------------------------------------------------------------

namespace ksuid
{

//-------------------------------------------------------------------------

Ksuid::Ksuid(uint32_t timestamp, const Payload& payload) noexcept
{
    setTimestamp(timestamp);
    setPayload(payload);
}

//-------------------------------------------------------------------------

Expected<Ksuid> Ksuid::withPayload(const Payload& payload)
{
    return withPayload(payload, systemNow());
}

//-------------------------------------------------------------------------

Expected<Ksuid> Ksuid::withPayload(const Payload& payload, std::chrono::sys_seconds now)
{
    return timestampFromTime(now).transform([&](uint32_t timestamp) {
        return Ksuid{timestamp, payload};
    });
}

//-------------------------------------------------------------------------

Expected<Ksuid> Ksuid::generate()
{
    thread_local RandomPayloadSource source;
    return generate(source);
}

//-------------------------------------------------------------------------

Expected<Ksuid> Ksuid::generate(PayloadSource& source)
{
    return withPayload(source.nextPayload());
}

//-------------------------------------------------------------------------

Expected<Ksuid> Ksuid::fromBase62(std::string_view str)
{
    if (str.size() != kBase62Length) {
        return std::unexpected{Error::invalidLength("Base62 string", kBase62Length, str.size())};
    }
    // Cheap filter ahead of the arithmetic; the codec would reject these too.
    if (str > kMaxBase62) {
        return std::unexpected{Error::valueTooLarge(fmt::format("Base62 string '{}'", str))};
    }
    return codec::base62::decode(str).transform([](const Bytes& bytes) {
        Ksuid id;
        id.m_bytes = bytes;
        return id;
    });
}

//-------------------------------------------------------------------------

Expected<Ksuid> Ksuid::fromHex(std::string_view str)
{
    return codec::hex::decode(str).transform([](const Bytes& bytes) {
        Ksuid id;
        id.m_bytes = bytes;
        return id;
    });
}

//-------------------------------------------------------------------------

Expected<Ksuid> Ksuid::fromBytes(std::span<const uint8_t> raw)
{
    if (raw.size() != kByteLength) {
        return std::unexpected{Error::invalidLength("raw KSUID", kByteLength, raw.size())};
    }
    Ksuid id;
    std::ranges::copy(raw, id.m_bytes.begin());
    return id;
}

//-------------------------------------------------------------------------

std::string Ksuid::toBase62() const
{
    auto str = codec::base62::encode(m_bytes);
    if (!str) [[unlikely]] {
        throw Exception{std::move(str).error()};
    }
    return std::move(str).value();
}

//-------------------------------------------------------------------------

std::string Ksuid::toHex() const
{
    return codec::hex::encode(m_bytes);
}

//-------------------------------------------------------------------------

uint32_t Ksuid::timestamp() const noexcept
{
    return static_cast<uint32_t>(m_bytes[0]) << 24
        | static_cast<uint32_t>(m_bytes[1]) << 16
        | static_cast<uint32_t>(m_bytes[2]) << 8
        | static_cast<uint32_t>(m_bytes[3]);
}

//-------------------------------------------------------------------------

void Ksuid::setTimestamp(uint32_t timestamp) noexcept
{
    m_bytes[0] = static_cast<uint8_t>(timestamp >> 24);
    m_bytes[1] = static_cast<uint8_t>(timestamp >> 16);
    m_bytes[2] = static_cast<uint8_t>(timestamp >> 8);
    m_bytes[3] = static_cast<uint8_t>(timestamp);
}

//-------------------------------------------------------------------------

Payload Ksuid::payload() const noexcept
{
    Payload payload;
    std::ranges::copy(bytes().subspan<kTimestampLength>(), payload.begin());
    return payload;
}

//-------------------------------------------------------------------------

void Ksuid::setPayload(const Payload& payload) noexcept
{
    std::ranges::copy(payload, m_bytes.begin() + kTimestampLength);
}

//-------------------------------------------------------------------------

std::chrono::sys_seconds Ksuid::time() const noexcept
{
    return std::chrono::sys_seconds{std::chrono::seconds{kEpochSeconds + timestamp()}};
}

//-------------------------------------------------------------------------

Expected<void> Ksuid::setTime(std::chrono::sys_seconds time)
{
    return timestampFromTime(time).transform([this](uint32_t timestamp) {
        setTimestamp(timestamp);
    });
}

//-------------------------------------------------------------------------

Expected<uint32_t> timestampFromTime(std::chrono::sys_seconds time)
{
    const int64_t unixSeconds = time.time_since_epoch().count();
    if (unixSeconds < kEpochSeconds
        || unixSeconds - kEpochSeconds > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return std::unexpected{Error::timestampOutOfRange(unixSeconds)};
    }
    const int64_t offset = unixSeconds - kEpochSeconds;
    return static_cast<uint32_t>(offset);
}

//-------------------------------------------------------------------------

}  // namespace ksuid

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/core/Generator.hpp"

#include <cstring>
#include <utility>

//-------------------------------------------------------------------------

namespace ksuid
{

//-------------------------------------------------------------------------

RandomPayloadSource::RandomPayloadSource()
    : m_engine{[] {
          std::random_device rd;
          std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
          return std::mt19937_64{seq};
      }()}
{}

//-------------------------------------------------------------------------

RandomPayloadSource::RandomPayloadSource(uint64_t seed) noexcept
    : m_engine{seed}
{}

//-------------------------------------------------------------------------

Payload RandomPayloadSource::nextPayload()
{
    static_assert(kPayloadLength % sizeof(uint64_t) == 0);
    Payload payload;
    for (size_t i = 0; i < payload.size(); i += sizeof(uint64_t)) {
        const uint64_t word = m_engine();
        std::memcpy(payload.data() + i, &word, sizeof(word));
    }
    return payload;
}

//-------------------------------------------------------------------------

std::chrono::sys_seconds systemNow()
{
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

//-------------------------------------------------------------------------

Generator::Generator(PayloadSource& source, Clock clock)
    : m_source{source}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

Expected<Ksuid> Generator::next()
{
    return Ksuid::withPayload(m_source.nextPayload(), m_clock());
}

//-------------------------------------------------------------------------

Expected<std::vector<Ksuid>> Generator::next(size_t count)
{
    std::vector<Ksuid> ids;
    for (size_t i = 0; i < count; ++i) {
        auto id = next();
        if (!id) {
            return std::unexpected{std::move(id).error()};
        }
        ids.push_back(*id);
    }
    return ids;
}

//-------------------------------------------------------------------------

}  // namespace ksuid

//-------------------------------------------------------------------------

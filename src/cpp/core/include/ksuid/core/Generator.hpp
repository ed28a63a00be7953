/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/core/Ksuid.hpp"

#include <chrono>
#include <functional>
#include <random>
#include <vector>

//-------------------------------------------------------------------------

namespace ksuid
{

//-------------------------------------------------------------------------

class PayloadSource
{
public:
    virtual ~PayloadSource() noexcept = default;

    [[nodiscard]] virtual Payload nextPayload() = 0;

protected:
    PayloadSource() noexcept = default;
};

//-------------------------------------------------------------------------

class RandomPayloadSource : public PayloadSource
{
public:
    RandomPayloadSource();
    explicit RandomPayloadSource(uint64_t seed) noexcept;

    [[nodiscard]] Payload nextPayload() override;

private:
    std::mt19937_64 m_engine;
};

//-------------------------------------------------------------------------

using Clock = std::function<std::chrono::sys_seconds()>;

[[nodiscard]] std::chrono::sys_seconds systemNow();

class Generator
{
public:
    explicit Generator(PayloadSource& source, Clock clock = systemNow);

    [[nodiscard]] Expected<Ksuid> next();
    [[nodiscard]] Expected<std::vector<Ksuid>> next(size_t count);

private:
    PayloadSource& m_source;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace ksuid

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>

#include "ksuid/codec/BaseConversion.hpp"
#include "ksuid/core/Generator.hpp"
#include "ksuid/core/Ksuid.hpp"

#include <array>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

using namespace ksuid;

//-------------------------------------------------------------------------

struct KsuidFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        RandomPayloadSource source{static_cast<uint64_t>(state.range(0))};
        ids.clear();
        strings.clear();
        for (uint32_t ts = 0; ts < kCount; ++ts) {
            const Ksuid id{ts * 7919u, source.nextPayload()};
            ids.push_back(id);
            strings.push_back(id.toBase62());
        }
    }

    static constexpr uint32_t kCount = 64;

    std::vector<Ksuid> ids;
    std::vector<std::string> strings;
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(KsuidFixture, ParseBase62)(benchmark::State& state)
{
    size_t i{};
    for (auto _ : state) {
        auto id = Ksuid::fromBase62(strings[i++ % kCount]);
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK_REGISTER_F(KsuidFixture, ParseBase62)->Arg(1);

BENCHMARK_DEFINE_F(KsuidFixture, RenderBase62)(benchmark::State& state)
{
    size_t i{};
    for (auto _ : state) {
        auto str = ids[i++ % kCount].toBase62();
        benchmark::DoNotOptimize(str);
    }
}
BENCHMARK_REGISTER_F(KsuidFixture, RenderBase62)->Arg(1);

BENCHMARK_DEFINE_F(KsuidFixture, RenderHex)(benchmark::State& state)
{
    size_t i{};
    for (auto _ : state) {
        auto str = ids[i++ % kCount].toHex();
        benchmark::DoNotOptimize(str);
    }
}
BENCHMARK_REGISTER_F(KsuidFixture, RenderHex)->Arg(1);

//-------------------------------------------------------------------------

static void Generate(benchmark::State& state)
{
    RandomPayloadSource source;
    Generator generator{source};
    for (auto _ : state) {
        auto id = generator.next();
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(Generate);

//-------------------------------------------------------------------------

static void ChangeBaseBytesToBase62(benchmark::State& state)
{
    static constexpr Bytes kInput{
        0x05, 0xA9, 0x5E, 0x21, 0xD7, 0xB6, 0xFE, 0x8C, 0xD7, 0xCF,
        0xF2, 0x11, 0x70, 0x4D, 0x8E, 0x7B, 0x94, 0x21, 0x21, 0x0B};

    std::array<uint8_t, kBase62Length> out;
    for (auto _ : state) {
        Bytes scratch = kInput;
        auto res = codec::changeBase(scratch, out, codec::kMaxBase, 62);
        benchmark::DoNotOptimize(res);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(ChangeBaseBytesToBase62);

static void ChangeBaseBase62ToBytes(benchmark::State& state)
{
    static constexpr std::array<uint8_t, kBase62Length> kInput{
        0, 50, 5, 15, 54, 0, 14, 14, 21, 27, 0, 41, 30,
        45, 17, 45, 37, 12, 49, 14, 55, 39, 30, 58, 26, 40, 3};

    Bytes out;
    for (auto _ : state) {
        auto scratch = kInput;
        auto res = codec::changeBase(scratch, out, 62, codec::kMaxBase);
        benchmark::DoNotOptimize(res);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(ChangeBaseBase62ToBytes);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
}

//-------------------------------------------------------------------------

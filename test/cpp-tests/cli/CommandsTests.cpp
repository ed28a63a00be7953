/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/cli/Commands.hpp"
#include "test-common/formatting.hpp"
#include "test-common/matchers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

using namespace ksuid;
using namespace ksuid::test;

using namespace testing;
using namespace std::chrono_literals;

//-------------------------------------------------------------------------

namespace
{

class FixedPayloadSource : public PayloadSource
{
public:
    explicit FixedPayloadSource(uint8_t value) noexcept : m_value{value} {}

    virtual Payload nextPayload() override
    {
        Payload payload;
        payload.fill(m_value++);
        return payload;
    }

private:
    uint8_t m_value;
};

std::vector<std::string> lines(const std::string& str)
{
    std::vector<std::string> res;
    std::istringstream iss{str};
    for (std::string line; std::getline(iss, line);) {
        res.push_back(line);
    }
    return res;
}

}  // namespace

//-------------------------------------------------------------------------

struct CommandsTest : Test
{
    virtual void SetUp() override
    {
        logger = std::make_shared<spdlog::logger>(
            "test", std::make_shared<spdlog::sinks::ostream_sink_st>(log));
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("[%l] %v");
    }

    std::ostringstream out;
    std::ostringstream log;
    std::shared_ptr<spdlog::logger> logger;
};

//-------------------------------------------------------------------------

TEST_F(CommandsTest, ParseAnyPicksCodecByLength)
{
    const auto fromBase62 = cli::parseAny("0o5Fs0EELR0fUjHjbCnEtdUwQe3");
    const auto fromHex = cli::parseAny("05A95E21D7B6FE8CD7CFF211704D8E7B9421210B");
    ASSERT_TRUE(fromBase62.has_value());
    ASSERT_TRUE(fromHex.has_value());
    EXPECT_EQ(*fromBase62, *fromHex);

    EXPECT_THAT(cli::parseAny(""), FailsWith(ErrorCode::INVALID_LENGTH));
    EXPECT_THAT(cli::parseAny("0o5Fs0EELR0fUjHjbCnEtdUwQe"), FailsWith(ErrorCode::INVALID_LENGTH));
    EXPECT_THAT(
        cli::parseAny("0o5Fs0EELR0fUjHjbCnEtdUwQ!3"), FailsWith(ErrorCode::INVALID_CHARACTER));
}

//-------------------------------------------------------------------------

TEST_F(CommandsTest, GenerateBase62)
{
    FixedPayloadSource source{0};
    const cli::GenerateConfig config{.count = 3, .format = cli::Format::base62};

    auto clock = [] { return std::chrono::sys_seconds{1400000001s}; };
    ASSERT_EQ(cli::runGenerate(config, source, out, *logger, clock), cli::kExitSuccess);

    const auto output = lines(out.str());
    ASSERT_EQ(output.size(), 3u);
    for (const auto& line : output) {
        const auto id = Ksuid::fromBase62(line);
        ASSERT_TRUE(id.has_value()) << line;
        EXPECT_EQ(id->timestamp(), 1u);
    }
    EXPECT_EQ(Ksuid::fromBase62(output[0]).value(), Ksuid(1, Payload{}));
    EXPECT_TRUE(std::ranges::is_sorted(output));
}

TEST_F(CommandsTest, GenerateHex)
{
    FixedPayloadSource source{0xAB};
    const cli::GenerateConfig config{.count = 1, .format = cli::Format::hex};

    auto clock = [] { return std::chrono::sys_seconds{1577836800s}; };
    ASSERT_EQ(cli::runGenerate(config, source, out, *logger, clock), cli::kExitSuccess);
    EXPECT_EQ(out.str(), "0A999300ABABABABABABABABABABABABABABABAB\n");
}

TEST_F(CommandsTest, GenerateOutOfRangeFails)
{
    FixedPayloadSource source{0};
    const cli::GenerateConfig config{.count = 2};

    auto clock = [] { return std::chrono::sys_seconds{}; };
    EXPECT_EQ(cli::runGenerate(config, source, out, *logger, clock), cli::kExitFailure);
    EXPECT_THAT(out.str(), IsEmpty());
    EXPECT_THAT(log.str(), HasSubstr("TIMESTAMP_OUT_OF_RANGE"));
}

TEST_F(CommandsTest, GenerateWritesEachIdAsItIsMade)
{
    FixedPayloadSource source{0};
    const cli::GenerateConfig config{.count = 5};

    size_t calls{};
    auto clock = [&calls] {
        return ++calls <= 3 ? std::chrono::sys_seconds{1400000001s} : std::chrono::sys_seconds{};
    };
    EXPECT_EQ(cli::runGenerate(config, source, out, *logger, clock), cli::kExitFailure);
    EXPECT_EQ(lines(out.str()).size(), 3u);
    EXPECT_THAT(log.str(), HasSubstr("Generation failed after 3 id(s)"));
}

TEST_F(CommandsTest, GenerateLargeCount)
{
    FixedPayloadSource source{0};
    const cli::GenerateConfig config{.count = 100'000, .format = cli::Format::hex};

    auto clock = [] { return std::chrono::sys_seconds{1577836800s}; };
    ASSERT_EQ(cli::runGenerate(config, source, out, *logger, clock), cli::kExitSuccess);

    const std::string output = out.str();
    EXPECT_EQ(output.size(), config.count * (kHexLength + 1));
    EXPECT_EQ(static_cast<size_t>(std::ranges::count(output, '\n')), config.count);
    EXPECT_THAT(output, StartsWith("0A99930000000000"));
}

//-------------------------------------------------------------------------

TEST_F(CommandsTest, InspectJson)
{
    const std::vector<std::string> ids{
        "0o5Fs0EELR0fUjHjbCnEtdUwQe3", "05a95e21d7b6fe8cd7cff211704d8e7b9421210b"};
    const cli::InspectConfig config{.utc = true, .json = true};

    ASSERT_EQ(cli::runInspect(ids, config, out, *logger), cli::kExitSuccess);

    const auto output = lines(out.str());
    ASSERT_EQ(output.size(), 2u);
    EXPECT_EQ(output[0], output[1]);
    EXPECT_THAT(output[0], HasSubstr(R"("timestamp":94985761)"));
    EXPECT_THAT(output[0], HasSubstr(R"("time":"Wed, 17 May 2017 01:49:21 UTC")"));
}

TEST_F(CommandsTest, InspectHumanReadable)
{
    const std::vector<std::string> ids{"0o5Fs0EELR0fUjHjbCnEtdUwQe3"};
    const cli::InspectConfig config{.utc = true};

    ASSERT_EQ(cli::runInspect(ids, config, out, *logger), cli::kExitSuccess);
    EXPECT_THAT(out.str(), StartsWith("\nREPRESENTATION:\n"));
    EXPECT_THAT(out.str(), HasSubstr("  Timestamp: 94985761\n"));
    EXPECT_THAT(log.str(), IsEmpty());
}

TEST_F(CommandsTest, InspectContinuesPastBadIds)
{
    const std::vector<std::string> ids{
        "bogus", "0o5Fs0EELR0fUjHjbCnEtdUwQe3", "aWgEPTl1tmebfsQzFP4bxwgy80W"};
    const cli::InspectConfig config{.utc = true, .json = true};

    EXPECT_EQ(cli::runInspect(ids, config, out, *logger), cli::kExitFailure);

    EXPECT_EQ(lines(out.str()).size(), 1u);
    EXPECT_THAT(log.str(), HasSubstr("'bogus': INVALID_LENGTH"));
    EXPECT_THAT(log.str(), HasSubstr("'aWgEPTl1tmebfsQzFP4bxwgy80W': VALUE_TOO_LARGE"));
    EXPECT_THAT(log.str(), HasSubstr("2 of 3 id(s) could not be inspected"));
}

//-------------------------------------------------------------------------

TEST(MakeLoggerTest, NamedAndLevelled)
{
    const auto logger = cli::makeLogger(spdlog::level::warn);
    EXPECT_EQ(logger->name(), "ksuid");
    EXPECT_EQ(logger->level(), spdlog::level::warn);
}

//-------------------------------------------------------------------------

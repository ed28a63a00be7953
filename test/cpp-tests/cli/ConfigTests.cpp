/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/cli/Config.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

using namespace ksuid;

using namespace testing;

//-------------------------------------------------------------------------

static const fs::path kTestDataPath{fs::path{__FILE__}.parent_path().parent_path() / "data"};

//-------------------------------------------------------------------------

TEST(ConfigTest, Defaults)
{
    const cli::Config config;
    EXPECT_EQ(config.generate().count, 1u);
    EXPECT_EQ(config.generate().format, cli::Format::base62);
    EXPECT_FALSE(config.inspect().utc);
    EXPECT_FALSE(config.inspect().json);
    EXPECT_EQ(config.log().level, spdlog::level::info);
}

TEST(ConfigTest, FromFile)
{
    const auto config = cli::Config::fromFile(kTestDataPath / "ksuid.xml");
    EXPECT_EQ(config.generate().count, 3u);
    EXPECT_EQ(config.generate().format, cli::Format::hex);
    EXPECT_TRUE(config.inspect().utc);
    EXPECT_TRUE(config.inspect().json);
    EXPECT_EQ(config.log().level, spdlog::level::debug);
}

TEST(ConfigTest, UnknownValuesFallBackToDefaults)
{
    const auto config = cli::Config::fromFile(kTestDataPath / "ksuid-partial.xml");
    EXPECT_EQ(config.generate().count, 1u);
    EXPECT_EQ(config.generate().format, cli::Format::base62);
    EXPECT_FALSE(config.inspect().utc);
    EXPECT_EQ(config.log().level, spdlog::level::info);
}

TEST(ConfigTest, FromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(<Ksuid><Generate count="10"/><Log level="off"/></Ksuid>)"));

    const auto config = cli::Config::fromXML(doc.child("Ksuid"));
    EXPECT_EQ(config.generate().count, 10u);
    EXPECT_EQ(config.generate().format, cli::Format::base62);
    EXPECT_EQ(config.log().level, spdlog::level::off);
}

struct InvalidCountTest : TestWithParam<const char*>
{
    virtual void SetUp() override
    {
        count = GetParam();
    }

    std::string count;
};

TEST_P(InvalidCountTest, FallsBackToDefault)
{
    pugi::xml_document doc;
    pugi::xml_node node = doc.append_child("Generate");
    node.append_attribute("count") = count.c_str();
    node.append_attribute("format") = "hex";

    const auto config = cli::GenerateConfig::fromXML(node);
    EXPECT_EQ(config.count, cli::GenerateConfig{}.count);
    EXPECT_EQ(config.format, cli::Format::hex);
}

INSTANTIATE_TEST_SUITE_P(
    ConfigTests,
    InvalidCountTest,
    Values("-1", "0", "-18446744073709551615", "many", ""));

TEST(ConfigTest, AccessorsAreMutable)
{
    cli::Config config;
    config.generate().count = 7;
    config.inspect().utc = true;
    EXPECT_EQ(config.generate().count, 7u);
    EXPECT_TRUE(config.inspect().utc);
}

TEST(ConfigTest, BadFilesThrow)
{
    EXPECT_THROW((void)cli::Config::fromFile(kTestDataPath / "missing.xml"), std::invalid_argument);
    EXPECT_THROW(
        (void)cli::Config::fromFile(kTestDataPath / "not-ksuid.xml"), std::invalid_argument);
}

TEST(ConfigTest, FormatNames)
{
    EXPECT_EQ(fmt::format("{}", cli::Format::base62), "base62");
    EXPECT_EQ(fmt::format("{}", cli::Format::hex), "hex");
}

//-------------------------------------------------------------------------

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/serialization/JsonSerializable.hpp"
#include "ksuid/serialization/json_util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>


//-------------------------------------------------------------------------

using namespace ksuid;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

struct Pair : json::JsonSerializable
{
    int first{};
    int second{};

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override
    {
        auto serialize = [this](rapidjson::Document& json) {
            json.SetObject();
            auto& allocator = json.GetAllocator();
            json.AddMember("first", rapidjson::Value{first}, allocator);
            json.AddMember("second", rapidjson::Value{second}, allocator);
        };
        json::serializeHelper(json, key, serialize);
    }
};

}  // namespace

//-------------------------------------------------------------------------

TEST(JsonUtilTest, CompactAndIndented)
{
    Pair pair;
    pair.first = 1;
    pair.second = 2;

    EXPECT_EQ(json::jsonSerializable2str(pair), R"({"first":1,"second":2})");
    EXPECT_EQ(
        json::jsonSerializable2str(pair, {.indent = json::IndentOptions{.indentCharCount = 2}}),
        "{\n  \"first\": 1,\n  \"second\": 2\n}");
}

TEST(JsonUtilTest, SerializeUnderKey)
{
    Pair pair;
    pair.first = 3;

    rapidjson::Document json;
    json.SetObject();
    pair.jsonSerialize(json, "pair");

    ASSERT_TRUE(json.HasMember("pair"));
    EXPECT_EQ(json["pair"]["first"].GetInt(), 3);
    EXPECT_EQ(json::json2str(json), R"({"pair":{"first":3,"second":0}})");
}

//-------------------------------------------------------------------------

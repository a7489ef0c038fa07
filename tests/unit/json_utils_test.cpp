// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2022 Datadog, Inc.

#include <chrono>
#include <cmath>
#include <cstddef>
#include <limits>
#include <fmt/format.h>
#include <string>

#include "exception.hpp"
#include "json_utils.hpp"

#include "common/gtest_utils.hpp"

using namespace piiredact;

namespace {

TEST(TestJsonUtils, Empty) { EXPECT_THROW(json_to_object(""), parsing_error); }

TEST(TestJsonUtils, Null)
{
    auto object = json_to_object("null");
    EXPECT_EQ(object.type(), object_type::null);
}

TEST(TestJsonUtils, Boolean)
{
    {
        auto object = json_to_object("true");
        EXPECT_EQ(object.type(), object_type::boolean);
        EXPECT_EQ(object.as<bool>(), true);
    }

    {
        auto object = json_to_object("false");
        EXPECT_EQ(object.type(), object_type::boolean);
        EXPECT_EQ(object.as<bool>(), false);
    }
}

TEST(TestJsonUtils, Signed)
{
    auto object = json_to_object("-5");
    EXPECT_EQ(object.type(), object_type::int64);
    EXPECT_EQ(object.as<int64_t>(), -5);
}

TEST(TestJsonUtils, Unsigned)
{
    {
        auto object = json_to_object("18446744073709551615");
        EXPECT_EQ(object.type(), object_type::uint64);
        EXPECT_EQ(object.as<uint64_t>(), 18446744073709551615ULL);
    }

    {
        auto object = json_to_object("12345678");
        EXPECT_EQ(object.type(), object_type::uint64);
        EXPECT_EQ(object.as<uint64_t>(), 12345678);
    }
}

TEST(TestJsonUtils, Double)
{
    auto object = json_to_object("5.5");
    EXPECT_EQ(object.type(), object_type::float64);
    EXPECT_EQ(object.as<double>(), 5.5);
}

TEST(TestJsonUtils, String)
{
    auto object = json_to_object(R"("My id is 123456-7890")");
    EXPECT_EQ(object.type(), object_type::string);
    EXPECT_STR(object.as<std::string_view>(), "My id is 123456-7890");
}

TEST(TestJsonUtils, NestedContainers)
{
    auto object = json_to_object(R"({"user":{"email":"a@b.com"},"tags":["x","a@b.com"],"n":1})");
    ASSERT_TRUE(object.is_map());
    ASSERT_EQ(object.size(), 3);
    EXPECT_STR(object.key_at(0), "user");
    EXPECT_STR(object.key_at(1), "tags");
    EXPECT_STR(object.key_at(2), "n");

    const auto *user = object.find("user");
    ASSERT_NE(user, nullptr);
    ASSERT_TRUE(user->is_map());
    EXPECT_STR(user->at(0).as<std::string_view>(), "a@b.com");

    const auto *tags = object.find("tags");
    ASSERT_NE(tags, nullptr);
    ASSERT_TRUE(tags->is_array());
    ASSERT_EQ(tags->size(), 2);
    EXPECT_STR(tags->at(1).as<std::string_view>(), "a@b.com");
}

TEST(TestJsonUtils, DuplicateKeys)
{
    auto object = json_to_object(R"({"a":1,"b":2,"a":"three"})");
    ASSERT_EQ(object.size(), 2);
    EXPECT_STR(object.key_at(0), "a");
    EXPECT_STR(object.at(0).as<std::string_view>(), "three");
}

TEST(TestJsonUtils, DuplicateKeysInNestedMaps)
{
    auto object = json_to_object(R"({"a":{"x":1,"x":2},"b":[{"x":3},{"x":4,"y":5,"x":6}],"a":{"z":7}})");
    auto expected = json_to_object(R"({"z":7})");
    ASSERT_EQ(object.size(), 2);
    EXPECT_STR(object.key_at(0), "a");
    EXPECT_EQ(object.at(0), expected);

    const auto &second = object.at(1).at(1);
    ASSERT_EQ(second.size(), 2);
    EXPECT_STR(second.key_at(0), "x");
    EXPECT_EQ(second.at(0).as<uint64_t>(), 6);
    EXPECT_STR(second.key_at(1), "y");
}

TEST(TestJsonUtils, WideObject)
{
    constexpr std::size_t size = 200000;

    std::string json{"{"};
    for (std::size_t i = 0; i < size; ++i) {
        json.append(fmt::format(R"("key{}":{},)", i, i));
    }
    json.append(R"("key0":"last"})");

    auto start = std::chrono::steady_clock::now();
    auto object = json_to_object(json);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(object.size(), size);
    EXPECT_STR(object.key_at(0), "key0");
    EXPECT_STR(object.at(0).as<std::string_view>(), "last");
    EXPECT_EQ(object.at(size - 1).as<uint64_t>(), size - 1);

    // Linear in the number of keys, a quadratic duplicate lookup takes about a minute
    EXPECT_LT(elapsed, std::chrono::seconds(20));
}

TEST(TestJsonUtils, InvalidJson)
{
    EXPECT_THROW(json_to_object("{"), parsing_error);
    EXPECT_THROW(json_to_object(R"({"a":})"), parsing_error);
    EXPECT_THROW(json_to_object("[1, 2"), parsing_error);
    EXPECT_THROW(json_to_object("true false"), parsing_error);
}

TEST(TestJsonUtils, MaxDepth)
{
    {
        std::string json = std::string(max_container_depth, '[') +
                           std::string(max_container_depth, ']');
        EXPECT_NO_THROW(json_to_object(json));
    }

    {
        std::string json = std::string(max_container_depth + 1, '[') +
                           std::string(max_container_depth + 1, ']');
        EXPECT_THROW(json_to_object(json), parsing_error);
    }

    EXPECT_THROW(json_to_object(R"({"a":{"b":{}}})", 2), parsing_error);
    EXPECT_NO_THROW(json_to_object(R"({"a":{"b":1}})", 2));
}

TEST(TestJsonUtils, Serialize)
{
    auto object = owned_object::make_map();
    object.emplace("b", 1U);
    object.emplace("a", -2);
    auto &list = object.emplace("list", owned_object::make_array());
    list.emplace_back(true);
    list.emplace_back(owned_object::make_null());
    list.emplace_back("x\"y");

    EXPECT_STR(object_to_json(object), R"({"b":1,"a":-2,"list":[true,null,"x\"y"]})");
}

TEST(TestJsonUtils, SerializePretty)
{
    auto object = owned_object::make_map();
    object.emplace("a", 1U);

    EXPECT_STR(object_to_json(object, true), "{\n  \"a\": 1\n}");
}

TEST(TestJsonUtils, SerializeNonFiniteAsNull)
{
    EXPECT_STR(object_to_json(owned_object{std::numeric_limits<double>::infinity()}), "null");
    EXPECT_STR(object_to_json(owned_object{std::nan("")}), "null");
}

TEST(TestJsonUtils, SerializeInvalid)
{
    auto object = owned_object::make_map();
    auto &list = object.emplace("b", owned_object::make_array());
    list.emplace_back(1U);
    list.emplace_back(owned_object{});

    try {
        [[maybe_unused]] auto json = object_to_json(object);
        FAIL() << "expected invalid_object";
    } catch (const invalid_object &e) {
        EXPECT_STR(e.what(), "invalid object found at 'b.1'");
    }
}

TEST(TestJsonUtils, DecodeEncode)
{
    constexpr std::string_view json = R"({"a":[1,-1,1.5,"s",null,false],"b":{}})";
    EXPECT_TRUE(test::JsonEquals(json, object_to_json(json_to_object(json))));
}

} // namespace

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "common/gtest_utils.hpp"

namespace {

TEST(TestPatternsInterface, Count) { EXPECT_EQ(piiredact_pattern_count(), 5); }

TEST(TestPatternsInterface, Info)
{
    piiredact_pattern info{};

    ASSERT_TRUE(piiredact_pattern_info(0, &info));
    EXPECT_STR(info.id, "cpr");
    EXPECT_STR(info.description, "Danish CPR number");
    EXPECT_STR(info.example, "******-****");

    ASSERT_TRUE(piiredact_pattern_info(1, &info));
    EXPECT_STR(info.id, "email");
    EXPECT_STR(info.example, "jo***@example.com");

    ASSERT_TRUE(piiredact_pattern_info(2, &info));
    EXPECT_STR(info.id, "phone");

    ASSERT_TRUE(piiredact_pattern_info(3, &info));
    EXPECT_STR(info.id, "creditCard");
    EXPECT_STR(info.description, "Credit card number");

    ASSERT_TRUE(piiredact_pattern_info(4, &info));
    EXPECT_STR(info.id, "ssn");
    EXPECT_STR(info.example, "***-**-****");
}

TEST(TestPatternsInterface, InfoStringsAreStable)
{
    piiredact_pattern first{};
    piiredact_pattern second{};
    ASSERT_TRUE(piiredact_pattern_info(1, &first));
    ASSERT_TRUE(piiredact_pattern_info(1, &second));
    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(first.description, second.description);
}

TEST(TestPatternsInterface, InvalidArguments)
{
    piiredact_pattern info{};
    EXPECT_FALSE(piiredact_pattern_info(5, &info));
    EXPECT_EQ(info.id, nullptr);
    EXPECT_FALSE(piiredact_pattern_info(0, nullptr));
}

} // namespace

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "configuration/masking_config_parser.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace piiredact;

namespace {

TEST(TestMaskingConfigParser, EmptyMap)
{
    auto config = parse_masking_config(owned_object::make_map());
    EXPECT_EQ(config, masking_config{});
    EXPECT_FALSE(config.enabled);
    for (auto type : all_pii_types) { EXPECT_TRUE(config.is_enabled(type)); }
}

TEST(TestMaskingConfigParser, EnabledOnlyWhenExplicitlyTrue)
{
    EXPECT_TRUE(parse_masking_config(yaml_to_object<owned_object>("enabled: true")).enabled);
    EXPECT_TRUE(parse_masking_config(yaml_to_object<owned_object>(R"(enabled: "TRUE")")).enabled);

    EXPECT_FALSE(parse_masking_config(yaml_to_object<owned_object>("enabled: false")).enabled);
    EXPECT_FALSE(parse_masking_config(yaml_to_object<owned_object>("enabled: 1")).enabled);
    EXPECT_FALSE(parse_masking_config(yaml_to_object<owned_object>("enabled: yes")).enabled);
    EXPECT_FALSE(parse_masking_config(yaml_to_object<owned_object>("enabled: ~")).enabled);
}

TEST(TestMaskingConfigParser, RulesDisabledOnlyWhenExplicitlyFalse)
{
    auto config = parse_masking_config(yaml_to_object<owned_object>(R"(
enabled: true
cpr: true
email: false
phone: "false"
creditCard: 0
ssn: no
)"));

    EXPECT_TRUE(config.enabled);
    EXPECT_TRUE(config.cpr);
    EXPECT_FALSE(config.email);
    EXPECT_FALSE(config.phone);
    EXPECT_TRUE(config.credit_card);
    EXPECT_TRUE(config.ssn);
}

TEST(TestMaskingConfigParser, CreditCardAlias)
{
    auto config =
        parse_masking_config(yaml_to_object<owned_object>("{enabled: true, credit_card: false}"));
    EXPECT_FALSE(config.credit_card);

    config = parse_masking_config(yaml_to_object<owned_object>("{enabled: true, creditCard: false}"));
    EXPECT_FALSE(config.credit_card);
}

TEST(TestMaskingConfigParser, NestedSection)
{
    auto config = parse_masking_config(yaml_to_object<owned_object>(R"(
server:
  port: 8080
pii_masking:
  enabled: true
  ssn: false
)"));

    EXPECT_TRUE(config.enabled);
    EXPECT_FALSE(config.ssn);
    EXPECT_TRUE(config.cpr);
}

TEST(TestMaskingConfigParser, UnknownKeysIgnored)
{
    auto config = parse_masking_config(
        yaml_to_object<owned_object>("{enabled: true, passport: false, iban: true}"));

    masking_config expected;
    expected.enabled = true;
    EXPECT_EQ(config, expected);
}

TEST(TestMaskingConfigParser, InvalidRoot)
{
    EXPECT_THROW(parse_masking_config(owned_object{"enabled"}), bad_cast);
    EXPECT_THROW(parse_masking_config(owned_object::make_array()), bad_cast);
    EXPECT_THROW(parse_masking_config(owned_object{}), bad_cast);
}

} // namespace

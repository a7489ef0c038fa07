// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>

#include "configuration/masking_config_parser.hpp"
#include "masker.hpp"

#include "common/gtest_utils.hpp"

using namespace piiredact;

namespace {

constexpr std::string_view base_dir = "integration/masking/";

void run_fixture(std::string_view filename)
{
    auto fixture = read_file<owned_object>(filename, base_dir);
    ASSERT_TRUE(fixture.is_map());

    const auto *config_node = fixture.find("config");
    ASSERT_NE(config_node, nullptr);
    const masker m{parse_masking_config(*config_node)};

    const auto *cases = fixture.find("cases");
    ASSERT_NE(cases, nullptr);
    ASSERT_TRUE(cases->is_array());
    ASSERT_FALSE(cases->empty());

    for (std::size_t i = 0; i < cases->size(); ++i) {
        const auto &test_case = cases->at(i);
        const auto *input = test_case.find("input");
        const auto *expected = test_case.find("output");
        ASSERT_NE(input, nullptr) << filename << " case " << i;
        ASSERT_NE(expected, nullptr) << filename << " case " << i;

        auto output = m.mask(*input);
        EXPECT_EQ(output, *expected) << filename << " case " << i;

        // Masking an already masked value changes nothing
        EXPECT_EQ(m.mask(output), output) << filename << " case " << i;
    }
}

TEST(TestMaskingIntegration, AllRules) { run_fixture("all_rules.yaml"); }

TEST(TestMaskingIntegration, RuleOptOut) { run_fixture("rule_opt_out.yaml"); }

TEST(TestMaskingIntegration, Disabled) { run_fixture("disabled.yaml"); }

TEST(TestMaskingIntegration, NestedConfigSection) { run_fixture("nested_config_section.yaml"); }

TEST(TestMaskingIntegration, Structures) { run_fixture("structures.yaml"); }

} // namespace

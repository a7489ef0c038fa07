// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "pattern/pii_type.hpp"
#include "pattern/rule.hpp"

namespace piiredact {

struct pattern_info {
    std::string_view id;
    std::string_view description;
    std::string_view example;
};

// Immutable, process-wide, list of rules. The rules are kept in the order in
// which they must be applied, which is also the order of pii_type.
class pattern_registry {
public:
    static constexpr std::string_view cpr_regex_str{R"(\b\d{6}-?\d{4}\b)"};
    static constexpr std::string_view email_regex_str{
        R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"};
    static constexpr std::string_view phone_regex_str{
        R"((?:\+45\s?|\b)(?:\d{2}\s?\d{2}\s?\d{2}\s?\d{2}|\d{8})\b)"};
    static constexpr std::string_view credit_card_regex_str{
        R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)"};
    static constexpr std::string_view ssn_regex_str{R"(\b\d{3}-\d{2}-\d{4}\b)"};

    static const pattern_registry &instance();

    ~pattern_registry() = default;
    pattern_registry(const pattern_registry &) = delete;
    pattern_registry(pattern_registry &&) = delete;
    pattern_registry &operator=(const pattern_registry &) = delete;
    pattern_registry &operator=(pattern_registry &&) = delete;

    [[nodiscard]] const std::vector<rule> &rules() const noexcept { return rules_; }
    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

    [[nodiscard]] const rule &at(pii_type type) const;
    // Returns nullptr if no rule exists with the given identifier
    [[nodiscard]] const rule *find(std::string_view id) const noexcept;

    [[nodiscard]] std::vector<pattern_info> documentation() const;

protected:
    pattern_registry();

    std::vector<rule> rules_;
};

// Keeps the first two characters of the local part and the domain
std::string mask_email(std::string_view match);

} // namespace piiredact

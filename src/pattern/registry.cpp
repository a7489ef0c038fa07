// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "log.hpp"
#include "pattern/pii_type.hpp"
#include "pattern/registry.hpp"
#include "pattern/rule.hpp"

namespace piiredact {

std::string mask_email(std::string_view match)
{
    static constexpr std::size_t visible_characters = 2;
    static constexpr std::string_view mask{"***@"};

    const auto at = match.find('@');
    if (at == std::string_view::npos) {
        // Unreachable with the email pattern
        return "***";
    }

    const auto local = match.substr(0, at);
    const auto domain = match.substr(at + 1);

    std::string output;
    output.reserve(visible_characters + mask.size() + domain.size());
    output.append(local.substr(0, visible_characters));
    output.append(mask);
    output.append(domain);
    return output;
}

pattern_registry::pattern_registry()
{
    rules_.reserve(all_pii_types.size());

    // Assume the patterns won't fail, this is validated during testing
    rules_.emplace_back(pii_type::cpr, cpr_regex_str, constant_placeholder{"******-****"},
        "Danish CPR number", "******-****");
    rules_.emplace_back(pii_type::email, email_regex_str, computed_placeholder{mask_email},
        "Email address", "jo***@example.com");
    rules_.emplace_back(pii_type::phone, phone_regex_str, constant_placeholder{"** ** ** **"},
        "Phone number", "** ** ** **");
    rules_.emplace_back(pii_type::credit_card, credit_card_regex_str,
        constant_placeholder{"**** **** **** ****"}, "Credit card number", "**** **** **** ****");
    rules_.emplace_back(pii_type::ssn, ssn_regex_str, constant_placeholder{"***-**-****"},
        "Social security number", "***-**-****");

    PIIREDACT_DEBUG("Pattern registry initialised with {} rules", rules_.size());
}

const pattern_registry &pattern_registry::instance()
{
    static const pattern_registry registry;
    return registry;
}

const rule &pattern_registry::at(pii_type type) const
{
    return rules_.at(static_cast<std::size_t>(type));
}

const rule *pattern_registry::find(std::string_view id) const noexcept
{
    for (const auto &r : rules_) {
        if (r.id() == id) {
            return &r;
        }
    }
    return nullptr;
}

std::vector<pattern_info> pattern_registry::documentation() const
{
    std::vector<pattern_info> info;
    info.reserve(rules_.size());
    for (const auto &r : rules_) { info.push_back({r.id(), r.description(), r.example()}); }
    return info;
}

} // namespace piiredact

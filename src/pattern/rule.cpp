// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "pattern/rule.hpp"
#include "regex_utils.hpp"

namespace piiredact {

namespace {

struct placeholder_generator {
    std::string_view match;

    std::string operator()(const constant_placeholder &p) const { return std::string{p.value}; }
    std::string operator()(const computed_placeholder &p) const { return p.fn(match); }
};

} // namespace

rule::rule(pii_type type, std::string_view regex_str, placeholder replacement,
    std::string_view description, std::string_view example)
    : type_(type), regex_(regex_init(regex_str)), replacement_(replacement),
      description_(description), example_(example)
{}

bool rule::match(std::string_view value) const { return regex_match(*regex_, value); }

std::size_t rule::redact(std::string &value) const
{
    const std::string_view input{value};

    std::string output;
    std::size_t count = 0;
    // First character which hasn't been copied to the output yet
    std::size_t read = 0;
    std::size_t start = 0;
    while (start <= input.size()) {
        auto match = regex_find(*regex_, input, start);
        if (!match.has_value()) {
            break;
        }

        const auto match_start = static_cast<std::size_t>(match->data() - input.data());
        const auto match_end = match_start + match->size();

        output.append(input.substr(read, match_start - read));
        output.append(replacement_for(*match));
        read = match_end;
        ++count;

        // An empty match must still make progress
        start = match->empty() ? match_end + 1 : match_end;
    }

    if (count > 0) {
        output.append(input.substr(read));
        value = std::move(output);
    }

    return count;
}

std::string rule::replacement_for(std::string_view match) const
{
    return std::visit(placeholder_generator{match}, replacement_);
}

} // namespace piiredact

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "exception.hpp"
#include "regex_utils.hpp"

namespace piiredact {

std::unique_ptr<re2::RE2> regex_init(std::string_view pattern, bool case_sensitive)
{
    constexpr unsigned regex_max_mem = 512 * 1024;

    re2::RE2::Options options;
    options.set_max_mem(static_cast<int64_t>(regex_max_mem));
    options.set_log_errors(false);
    options.set_case_sensitive(case_sensitive);

    const re2::StringPiece pattern_ref(pattern.data(), pattern.size());
    auto regex = std::make_unique<re2::RE2>(pattern_ref, options);
    if (!regex->ok()) {
        throw parsing_error(
            "invalid regular expression (" + std::string(pattern) + "): " + regex->error_arg());
    }
    return regex;
}

bool regex_match(const re2::RE2 &regex, std::string_view subject, re2::RE2::Anchor anchor)
{
    const re2::StringPiece subject_ref(subject.data(), subject.size());
    return regex.Match(subject_ref, 0, subject_ref.size(), anchor, nullptr, 0);
}

std::optional<std::string_view> regex_find(
    const re2::RE2 &regex, std::string_view subject, std::size_t start)
{
    if (start > subject.size()) {
        return std::nullopt;
    }

    const re2::StringPiece subject_ref(subject.data(), subject.size());
    re2::StringPiece match;
    if (!regex.Match(subject_ref, start, subject_ref.size(), re2::RE2::UNANCHORED, &match, 1)) {
        return std::nullopt;
    }

    return std::string_view{match.data(), match.size()};
}

} // namespace piiredact

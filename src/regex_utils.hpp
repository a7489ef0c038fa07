// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <string_view>

namespace piiredact {

std::unique_ptr<re2::RE2> regex_init(std::string_view pattern, bool case_sensitive = true);
bool regex_match(
    const re2::RE2 &regex, std::string_view subject, re2::RE2::Anchor anchor = re2::RE2::UNANCHORED);

// Find the leftmost match within subject starting at offset start. The whole
// subject is still used as context, so that assertions such as \b behave as
// if the search had started from the beginning of the string.
std::optional<std::string_view> regex_find(
    const re2::RE2 &regex, std::string_view subject, std::size_t start = 0);

} // namespace piiredact

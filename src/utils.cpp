// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string_view>

#include "utils.hpp"

namespace piiredact {

std::string_view trim(std::string_view str)
{
    std::size_t start = 0;
    while (start < str.size() && isspace(str[start])) { ++start; }

    std::size_t end = str.size();
    while (end > start && isspace(str[end - 1])) { --end; }

    return str.substr(start, end - start);
}

} // namespace piiredact

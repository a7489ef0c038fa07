// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>
#include <variant>

#include "pattern/pii_type.hpp"

namespace piiredact {

// Placeholder substituted verbatim for every occurrence
struct constant_placeholder {
    std::string_view value;
};

// Placeholder computed from the matched substring
struct computed_placeholder {
    using function_type = std::string (*)(std::string_view match);
    function_type fn;
};

using placeholder = std::variant<constant_placeholder, computed_placeholder>;

class rule {
public:
    rule(pii_type type, std::string_view regex_str, placeholder replacement,
        std::string_view description, std::string_view example);
    ~rule() = default;
    rule(const rule &) = delete;
    rule(rule &&) noexcept = default;
    rule &operator=(const rule &) = delete;
    rule &operator=(rule &&) noexcept = default;

    [[nodiscard]] pii_type type() const noexcept { return type_; }
    [[nodiscard]] std::string_view id() const noexcept { return pii_type_to_string(type_); }
    [[nodiscard]] std::string_view description() const noexcept { return description_; }
    [[nodiscard]] std::string_view example() const noexcept { return example_; }
    [[nodiscard]] std::string_view to_string() const { return regex_->pattern(); }

    [[nodiscard]] bool match(std::string_view value) const;

    // Replaces every non-overlapping occurrence of the pattern, scanning from
    // left to right, and returns the number of replacements performed. The
    // string is only modified when at least one occurrence was found.
    std::size_t redact(std::string &value) const;

protected:
    [[nodiscard]] std::string replacement_for(std::string_view match) const;

    pii_type type_;
    std::unique_ptr<re2::RE2> regex_;
    placeholder replacement_;
    std::string_view description_;
    std::string_view example_;
};

} // namespace piiredact

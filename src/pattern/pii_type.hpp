// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace piiredact {

// Categories of personally identifiable information, the order of the
// enumerators is the order in which the patterns are applied.
enum class pii_type : uint8_t { cpr, email, phone, credit_card, ssn };

inline constexpr std::array<pii_type, 5> all_pii_types{
    pii_type::cpr, pii_type::email, pii_type::phone, pii_type::credit_card, pii_type::ssn};

constexpr std::string_view pii_type_to_string(pii_type type)
{
    switch (type) {
    case pii_type::cpr:
        return "cpr";
    case pii_type::email:
        return "email";
    case pii_type::phone:
        return "phone";
    case pii_type::credit_card:
        return "creditCard";
    case pii_type::ssn:
        return "ssn";
    }
    return "unknown";
}

constexpr std::optional<pii_type> pii_type_from_string(std::string_view str)
{
    for (auto type : all_pii_types) {
        if (pii_type_to_string(type) == str) {
            return type;
        }
    }

    // Accepted for consistency with the C interface and environment variables
    if (str == "credit_card") {
        return pii_type::credit_card;
    }

    return std::nullopt;
}

} // namespace piiredact

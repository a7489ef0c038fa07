// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include "pattern/pii_type.hpp"

namespace piiredact {

// Masking is opt-in through the top-level gate, once enabled every pattern
// is applied unless explicitly disabled.
struct masking_config {
    bool enabled{false};

    bool cpr{true};
    bool email{true};
    bool phone{true};
    bool credit_card{true};
    bool ssn{true};

    [[nodiscard]] constexpr bool is_enabled(pii_type type) const noexcept
    {
        switch (type) {
        case pii_type::cpr:
            return cpr;
        case pii_type::email:
            return email;
        case pii_type::phone:
            return phone;
        case pii_type::credit_card:
            return credit_card;
        case pii_type::ssn:
            return ssn;
        }
        return true;
    }

    constexpr void set(pii_type type, bool value) noexcept
    {
        switch (type) {
        case pii_type::cpr:
            cpr = value;
            break;
        case pii_type::email:
            email = value;
            break;
        case pii_type::phone:
            phone = value;
            break;
        case pii_type::credit_card:
            credit_card = value;
            break;
        case pii_type::ssn:
            ssn = value;
            break;
        }
    }

    bool operator==(const masking_config &other) const = default;
};

} // namespace piiredact

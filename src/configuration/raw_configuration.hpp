// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "object.hpp"

namespace piiredact {

// Read-only view over a configuration document decoded into an object, the
// underlying object must outlive the view.
class raw_configuration {
public:
    using map = std::vector<std::pair<std::string_view, raw_configuration>>;

    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    raw_configuration(const owned_object &obj) : obj_(&obj) {}
    ~raw_configuration() = default;
    raw_configuration(const raw_configuration &) = default;
    raw_configuration &operator=(const raw_configuration &) = default;
    raw_configuration(raw_configuration &&other) noexcept = default;
    raw_configuration &operator=(raw_configuration &&other) noexcept = default;

    // Entries are returned in document order
    explicit operator map() const;

    // True only for a boolean true or the string "true", in any case
    [[nodiscard]] bool is_true() const noexcept;
    // True only for a boolean false or the string "false", in any case
    [[nodiscard]] bool is_false() const noexcept;

protected:
    const owned_object *obj_;
};

} // namespace piiredact

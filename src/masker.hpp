// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "masking_config.hpp"
#include "object.hpp"
#include "pattern/registry.hpp"
#include "pattern/rule.hpp"

namespace piiredact {

// The masker binds a configuration to the rules of the registry which must
// be applied. It holds no mutable state and can be shared across threads.
class masker {
public:
    explicit masker(
        const masking_config &config, const pattern_registry &registry = pattern_registry::instance());

    // Returns a new object with the same shape as the input, where every
    // string has been redacted. Non-string scalars are copied as-is. The
    // traversal is iterative, the depth of the input isn't limited.
    //
    // Throws invalid_object if an invalid object is found within the input.
    [[nodiscard]] owned_object mask(const owned_object &input) const;

    [[nodiscard]] std::string mask_string(std::string_view value) const;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::vector<std::reference_wrapper<const rule>> &active_rules() const noexcept
    {
        return rules_;
    }

protected:
    // Masks scalars and creates empty containers with enough capacity for
    // all their children, invalid objects are returned as-is.
    [[nodiscard]] owned_object mask_node(const owned_object &input) const;

    bool enabled_;
    std::vector<std::reference_wrapper<const rule>> rules_;
};

owned_object mask(const owned_object &input, const masking_config &config);
std::string mask_string(std::string_view value, const masking_config &config);

} // namespace piiredact

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>

#include "configuration/raw_configuration.hpp"
#include "exception.hpp"
#include "object_type.hpp"
#include "utils.hpp"

namespace piiredact {

raw_configuration::operator raw_configuration::map() const
{
    if (!obj_->is_map()) {
        throw bad_cast("map", object_type_to_string<std::string>(obj_->type()));
    }

    raw_configuration::map map;
    map.reserve(obj_->size());
    for (std::size_t i = 0; i < obj_->size(); ++i) {
        map.emplace_back(obj_->key_at(i), obj_->at(i));
    }
    return map;
}

bool raw_configuration::is_true() const noexcept
{
    if (obj_->is<bool>()) {
        return obj_->as<bool>();
    }

    return obj_->is_string() && string_iequals_literal(obj_->as<std::string_view>(), "true");
}

bool raw_configuration::is_false() const noexcept
{
    if (obj_->is<bool>()) {
        return !obj_->as<bool>();
    }

    return obj_->is_string() && string_iequals_literal(obj_->as<std::string_view>(), "false");
}

} // namespace piiredact

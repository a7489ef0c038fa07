// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "object.hpp"

namespace piiredact {

inline constexpr std::size_t max_container_depth = 256;

// Throws parsing_error if the document isn't valid JSON or if its containers
// are nested deeper than max_depth.
owned_object json_to_object(std::string_view json, std::size_t max_depth = max_container_depth);

// Map keys are serialized in insertion order, non-finite floating point values
// are serialized as null. Throws invalid_object if the object, or any of its
// descendants, is invalid.
std::string object_to_json(const owned_object &obj, bool pretty = false);

} // namespace piiredact

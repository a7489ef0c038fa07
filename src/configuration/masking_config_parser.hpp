// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include "masking_config.hpp"
#include "object.hpp"

namespace piiredact {

// Build a masking configuration from a document of the following form, where
// every key is optional and the whole map may be nested under "pii_masking":
//
//   enabled: true
//   cpr: true
//   email: true
//   phone: false
//   creditCard: true
//   ssn: true
//
// Masking is only enabled by an explicit true, while patterns are only
// disabled by an explicit false. Throws bad_cast if the root isn't a map.
masking_config parse_masking_config(const owned_object &root);

} // namespace piiredact

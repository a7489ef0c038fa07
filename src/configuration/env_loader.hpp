// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "masking_config.hpp"

namespace piiredact {

using env_getter = std::function<const char *(const char *name)>;

// Returns the KEY=VALUE assignments of a .env file in file order. Blank lines,
// comments and assignments with an empty key or value are skipped.
std::vector<std::pair<std::string, std::string>> parse_dotenv(std::string_view contents);

// Exports the assignments of a .env file into the process environment, without
// overriding variables which are already set. Returns false if the file can't
// be read.
bool load_dotenv(const std::string &path);

// Masking is enabled when PII_MASKING_ENABLED is "true", each pattern can then
// be disabled by setting PII_MASK_<PATTERN> to "false".
masking_config masking_config_from_env(const env_getter &getenv_fn);
masking_config masking_config_from_env();

} // namespace piiredact

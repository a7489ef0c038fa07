// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "configuration/env_loader.hpp"
#include "log.hpp"
#include "masking_config.hpp"
#include "pattern/pii_type.hpp"
#include "utils.hpp"

namespace piiredact {

namespace {

constexpr std::string_view enabled_variable = "PII_MASKING_ENABLED";

constexpr const char *pii_type_to_variable(pii_type type)
{
    switch (type) {
    case pii_type::cpr:
        return "PII_MASK_CPR";
    case pii_type::email:
        return "PII_MASK_EMAIL";
    case pii_type::phone:
        return "PII_MASK_PHONE";
    case pii_type::credit_card:
        return "PII_MASK_CREDIT_CARD";
    case pii_type::ssn:
        return "PII_MASK_SSN";
    }
    return "";
}

} // namespace

std::vector<std::pair<std::string, std::string>> parse_dotenv(std::string_view contents)
{
    std::vector<std::pair<std::string, std::string>> assignments;

    while (!contents.empty()) {
        auto eol = contents.find('\n');
        auto line = trim(contents.substr(0, eol));
        contents.remove_prefix(eol == std::string_view::npos ? contents.size() : eol + 1);

        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto equal = line.find('=');
        if (equal == std::string_view::npos) {
            PIIREDACT_DEBUG("Ignoring malformed environment line '{}'", line);
            continue;
        }

        auto key = trim(line.substr(0, equal));
        auto value = trim(line.substr(equal + 1));
        if (key.empty() || value.empty()) {
            continue;
        }

        assignments.emplace_back(key, value);
    }

    return assignments;
}

bool load_dotenv(const std::string &path)
{
    std::ifstream file(path, std::ios::in);
    if (!file) {
        PIIREDACT_DEBUG("Environment file '{}' not found", path);
        return false;
    }

    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

    for (const auto &[key, value] : parse_dotenv(contents)) {
        // Existing variables take precedence
        if (setenv(key.c_str(), value.c_str(), 0) != 0) {
            PIIREDACT_WARN("Failed to export environment variable '{}'", key);
        }
    }

    return true;
}

masking_config masking_config_from_env(const env_getter &getenv_fn)
{
    masking_config config;

    const char *enabled = getenv_fn(enabled_variable.data());
    config.enabled = enabled != nullptr && std::string_view{enabled} == "true";

    for (auto type : all_pii_types) {
        const char *value = getenv_fn(pii_type_to_variable(type));
        config.set(type, value == nullptr || std::string_view{value} != "false");
    }

    return config;
}

masking_config masking_config_from_env()
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    return masking_config_from_env([](const char *name) -> const char * { return getenv(name); });
}

} // namespace piiredact

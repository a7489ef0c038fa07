// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <new>
#include <string>
#include <string_view>
#include <vector>

#include "exception.hpp"
#include "json_utils.hpp"
#include "log.hpp"
#include "masker.hpp"
#include "masking_config.hpp"
#include "object.hpp"
#include "pattern/registry.hpp"
#include "piiredact.h"
#include "version.hpp"

using namespace piiredact;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == PIIREDACT_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == PIIREDACT_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == PIIREDACT_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == PIIREDACT_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == PIIREDACT_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == PIIREDACT_LOG_OFF);

namespace {

masking_config config_from_c(const piiredact_config *config)
{
    masking_config output;
    if (config != nullptr) {
        output.enabled = config->enabled;
        output.cpr = config->rules.cpr;
        output.email = config->rules.email;
        output.phone = config->rules.phone;
        output.credit_card = config->rules.credit_card;
        output.ssn = config->rules.ssn;
    }
    return output;
}

// NUL-terminated copies of the pattern documentation
struct pattern_strings {
    std::string id;
    std::string description;
    std::string example;
};

const std::vector<pattern_strings> &pattern_documentation()
{
    static const std::vector<pattern_strings> documentation = [] {
        std::vector<pattern_strings> output;
        for (const auto &info : pattern_registry::instance().documentation()) {
            output.push_back({std::string{info.id}, std::string{info.description},
                std::string{info.example}});
        }
        return output;
    }();
    return documentation;
}

} // namespace

extern "C" {

piiredact_config piiredact_default_config()
{
    const masking_config defaults;
    return {defaults.enabled, {defaults.cpr, defaults.email, defaults.phone, defaults.credit_card,
                                  defaults.ssn}};
}

PIIREDACT_RET_CODE piiredact_mask_json(const char *json, size_t length,
    const piiredact_config *config, char **output, size_t *output_length)
{
    if (json == nullptr || output == nullptr) {
        PIIREDACT_WARN("Illegal call to piiredact_mask_json: null argument");
        return PIIREDACT_ERR_INVALID_ARGUMENT;
    }

    *output = nullptr;
    if (output_length != nullptr) {
        *output_length = 0;
    }

    try {
        auto input = json_to_object({json, length});
        auto masked = mask(input, config_from_c(config));
        auto result = object_to_json(masked);

        // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
        auto *buffer = static_cast<char *>(malloc(result.size() + 1));
        if (buffer == nullptr) {
            throw std::bad_alloc();
        }
        memcpy(buffer, result.c_str(), result.size() + 1);

        *output = buffer;
        if (output_length != nullptr) {
            *output_length = result.size();
        }
        return PIIREDACT_OK;
    } catch (const parsing_error &e) {
        PIIREDACT_WARN("Failed to decode input: {}", e.what());
        return PIIREDACT_ERR_INVALID_OBJECT;
    } catch (const invalid_object &e) {
        PIIREDACT_WARN("{}", e.what());
        return PIIREDACT_ERR_INVALID_OBJECT;
    } catch (const std::exception &e) {
        PIIREDACT_ERROR("{}", e.what());
    } catch (...) {
        PIIREDACT_ERROR("unknown exception");
    }

    return PIIREDACT_ERR_INTERNAL;
}

void piiredact_buffer_free(char *buffer)
{
    // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
    free(buffer);
}

size_t piiredact_pattern_count()
{
    try {
        return pattern_registry::instance().size();
    } catch (const std::exception &e) {
        PIIREDACT_ERROR("{}", e.what());
    }
    return 0;
}

bool piiredact_pattern_info(size_t index, piiredact_pattern *info)
{
    if (info == nullptr) {
        return false;
    }

    try {
        const auto &documentation = pattern_documentation();
        if (index >= documentation.size()) {
            return false;
        }

        const auto &entry = documentation[index];
        info->id = entry.id.c_str();
        info->description = entry.description.c_str();
        info->example = entry.example.c_str();
        return true;
    } catch (const std::exception &e) {
        PIIREDACT_ERROR("{}", e.what());
    }

    return false;
}

const char *piiredact_get_version() { return current_version.data(); }

bool piiredact_set_log_cb(piiredact_log_cb cb, PIIREDACT_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    logger::init(cb, level);
    PIIREDACT_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}
}

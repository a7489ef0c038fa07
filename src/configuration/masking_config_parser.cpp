// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>

#include "configuration/masking_config_parser.hpp"
#include "configuration/raw_configuration.hpp"
#include "log.hpp"
#include "masking_config.hpp"
#include "object.hpp"
#include "pattern/pii_type.hpp"

namespace piiredact {

masking_config parse_masking_config(const owned_object &root)
{
    const auto *section = root.find("pii_masking");
    if (section != nullptr && section->is_map()) {
        return parse_masking_config(*section);
    }

    masking_config config;

    auto entries = static_cast<raw_configuration::map>(raw_configuration{root});
    for (const auto &[key, value] : entries) {
        if (key == "enabled") {
            config.enabled = value.is_true();
            continue;
        }

        auto type = pii_type_from_string(key);
        if (!type.has_value()) {
            PIIREDACT_WARN("Unknown masking configuration key '{}', ignoring", key);
            continue;
        }

        // Anything other than an explicit false keeps the pattern enabled
        config.set(*type, !value.is_false());
    }

    PIIREDACT_DEBUG("Masking configuration: enabled={}, cpr={}, email={}, phone={}, "
                    "creditCard={}, ssn={}",
        config.enabled, config.cpr, config.email, config.phone, config.credit_card, config.ssn);

    return config;
}

} // namespace piiredact

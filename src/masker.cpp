// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "exception.hpp"
#include "log.hpp"
#include "masker.hpp"
#include "masking_config.hpp"
#include "object.hpp"
#include "object_type.hpp"
#include "pattern/registry.hpp"

namespace piiredact {

namespace {

using key_type = std::variant<std::string_view, std::size_t>;

// Containers are visited breadth-first, each one remembers its parent so
// that the path of an invalid object can be reported.
struct pending_container {
    static constexpr std::size_t root = static_cast<std::size_t>(-1);

    const owned_object *source;
    owned_object *destination;
    std::size_t parent;
    key_type key;
};

std::string key_path_to_string(
    const std::vector<pending_container> &containers, std::size_t index, const key_type &last)
{
    std::vector<const key_type *> keys{&last};
    for (auto i = index; containers[i].parent != pending_container::root;
         i = containers[i].parent) {
        keys.emplace_back(&containers[i].key);
    }

    std::string output;
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
        if (!output.empty()) {
            output.append(".");
        }
        std::visit([&output](const auto &k) { output.append(fmt::format("{}", k)); }, **it);
    }
    return output;
}

} // namespace

masker::masker(const masking_config &config, const pattern_registry &registry)
    : enabled_(config.enabled)
{
    if (!enabled_) {
        PIIREDACT_DEBUG("Masking disabled");
        return;
    }

    for (const auto &r : registry.rules()) {
        if (config.is_enabled(r.type())) {
            rules_.emplace_back(r);
        } else {
            PIIREDACT_DEBUG("Masking of {} disabled", r.id());
        }
    }
}

std::string masker::mask_string(std::string_view value) const
{
    std::string output{value};
    for (const rule &r : rules_) {
        auto count = r.redact(output);
        if (count > 0) {
            PIIREDACT_TRACE("Redacted {} occurrence(s) of {}", count, r.id());
        }
    }
    return output;
}

owned_object masker::mask_node(const owned_object &input) const
{
    switch (input.type()) {
    case object_type::string:
        return mask_string(input.as<std::string_view>());
    case object_type::array:
        return owned_object::make_array(input.size());
    case object_type::map:
        return owned_object::make_map(input.size());
    case object_type::null:
    case object_type::boolean:
    case object_type::int64:
    case object_type::uint64:
    case object_type::float64:
        return input.clone();
    case object_type::invalid:
    default:
        break;
    }
    return {};
}

owned_object masker::mask(const owned_object &input) const
{
    if (!enabled_) {
        return input.clone();
    }

    auto output = mask_node(input);
    if (output.is_invalid()) {
        throw invalid_object("");
    }

    if (!output.is_container()) {
        return output;
    }

    std::vector<pending_container> containers{
        {&input, &output, pending_container::root, std::size_t{0}}};
    for (std::size_t current = 0; current < containers.size(); ++current) {
        // Copied as the vector grows below
        const auto *source = containers[current].source;
        auto *destination = containers[current].destination;

        const bool is_map = source->is_map();
        auto key_at = [&](std::size_t i) -> key_type {
            if (is_map) {
                return source->key_at(i);
            }
            return i;
        };

        // Source keys are unique, so they are appended without lookup
        for (std::size_t i = 0; i < source->size(); ++i) {
            auto value = mask_node(source->at(i));
            if (value.is_invalid()) {
                throw invalid_object(key_path_to_string(containers, current, key_at(i)));
            }

            if (is_map) {
                destination->emplace_back(source->key_at(i), std::move(value));
            } else {
                destination->emplace_back(std::move(value));
            }
        }

        // The destination is complete, references to its children remain valid
        for (std::size_t i = 0; i < source->size(); ++i) {
            const auto &child = source->at(i);
            if (child.is_container()) {
                containers.push_back({&child, &destination->at(i), current, key_at(i)});
            }
        }
    }

    return output;
}

owned_object mask(const owned_object &input, const masking_config &config)
{
    return masker{config}.mask(input);
}

std::string mask_string(std::string_view value, const masking_config &config)
{
    if (!config.enabled) {
        return std::string{value};
    }
    return masker{config}.mask_string(value);
}

} // namespace piiredact

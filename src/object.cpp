// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "object.hpp"
#include "object_type.hpp"

namespace piiredact {

owned_object owned_object::make_array(std::size_t capacity)
{
    owned_object obj{std::in_place_type<array_type>};
    std::get<array_type>(obj.value_).reserve(capacity);
    return obj;
}

owned_object owned_object::make_map(std::size_t capacity)
{
    owned_object obj{std::in_place_type<map_type>};
    std::get<map_type>(obj.value_).reserve(capacity);
    return obj;
}

owned_object::~owned_object()
{
    bool nested = false;
    if (const auto *array = std::get_if<array_type>(&value_); array != nullptr) {
        nested = std::any_of(
            array->begin(), array->end(), [](const auto &item) { return item.is_container(); });
    } else if (const auto *map = std::get_if<map_type>(&value_); map != nullptr) {
        nested = std::any_of(
            map->begin(), map->end(), [](const auto &item) { return item.second.is_container(); });
    }

    if (!nested) {
        return;
    }

    std::vector<owned_object> pending;
    release_children(pending);
    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();
        current.release_children(pending);
    }
}

void owned_object::release_children(std::vector<owned_object> &children)
{
    if (auto *array = std::get_if<array_type>(&value_); array != nullptr) {
        for (auto &item : *array) { children.emplace_back(std::move(item)); }
        array->clear();
    } else if (auto *map = std::get_if<map_type>(&value_); map != nullptr) {
        for (auto &[key, value] : *map) { children.emplace_back(std::move(value)); }
        map->clear();
    }
}

object_type owned_object::type() const noexcept
{
    switch (value_.index()) {
    case 1:
        return object_type::null;
    case 2:
        return object_type::boolean;
    case 3:
        return object_type::int64;
    case 4:
        return object_type::uint64;
    case 5:
        return object_type::float64;
    case 6:
        return object_type::string;
    case 7:
        return object_type::array;
    case 8:
        return object_type::map;
    case 0:
    default:
        break;
    }
    return object_type::invalid;
}

std::size_t owned_object::size() const noexcept
{
    if (const auto *str = std::get_if<std::string>(&value_); str != nullptr) {
        return str->size();
    }

    if (const auto *array = std::get_if<array_type>(&value_); array != nullptr) {
        return array->size();
    }

    if (const auto *map = std::get_if<map_type>(&value_); map != nullptr) {
        return map->size();
    }

    return 0;
}

const owned_object &owned_object::at(std::size_t idx) const
{
    if (const auto *map = std::get_if<map_type>(&value_); map != nullptr) {
        return map->at(idx).second;
    }
    return std::get<array_type>(value_).at(idx);
}

owned_object &owned_object::at(std::size_t idx)
{
    if (auto *map = std::get_if<map_type>(&value_); map != nullptr) {
        return map->at(idx).second;
    }
    return std::get<array_type>(value_).at(idx);
}

std::string_view owned_object::key_at(std::size_t idx) const
{
    return std::get<map_type>(value_).at(idx).first;
}

const owned_object *owned_object::find(std::string_view key) const
{
    const auto *map = std::get_if<map_type>(&value_);
    if (map == nullptr) {
        return nullptr;
    }

    for (const auto &[k, v] : *map) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

owned_object &owned_object::emplace_back(owned_object &&value)
{
    auto *array = std::get_if<array_type>(&value_);
    if (array == nullptr) {
        throw std::invalid_argument("emplace_back: object is not an array");
    }

    return array->emplace_back(std::move(value));
}

owned_object &owned_object::emplace(std::string_view key, owned_object &&value)
{
    auto *map = std::get_if<map_type>(&value_);
    if (map == nullptr) {
        throw std::invalid_argument("emplace: object is not a map");
    }

    for (auto &[k, v] : *map) {
        if (k == key) {
            v = std::move(value);
            return v;
        }
    }

    return map->emplace_back(std::string{key}, std::move(value)).second;
}

owned_object &owned_object::emplace_back(std::string_view key, owned_object &&value)
{
    auto *map = std::get_if<map_type>(&value_);
    if (map == nullptr) {
        throw std::invalid_argument("emplace_back: object is not a map");
    }

    return map->emplace_back(std::string{key}, std::move(value)).second;
}

owned_object owned_object::clone() const
{
    // Scalars are copied, containers are created empty with enough capacity
    // for all their children.
    auto clone_helper = [](const owned_object &source) -> owned_object {
        switch (source.type()) {
        case object_type::null:
            return make_null();
        case object_type::boolean:
            return make_boolean(source.as<bool>());
        case object_type::int64:
            return make_signed(source.as<int64_t>());
        case object_type::uint64:
            return make_unsigned(source.as<uint64_t>());
        case object_type::float64:
            return make_float(source.as<double>());
        case object_type::string:
            return make_string(source.as<std::string_view>());
        case object_type::array:
            return make_array(source.size());
        case object_type::map:
            return make_map(source.size());
        case object_type::invalid:
        default:
            break;
        }
        return {};
    };

    std::deque<std::pair<const owned_object *, owned_object *>> queue;

    auto copy = clone_helper(*this);
    if (copy.is_container()) {
        queue.emplace_back(this, &copy);
    }

    while (!queue.empty()) {
        auto [source, destination] = queue.front();
        queue.pop_front();

        if (const auto *map = std::get_if<map_type>(&source->value_); map != nullptr) {
            for (const auto &[key, value] : *map) {
                destination->emplace_back(key, clone_helper(value));
            }
        } else {
            for (const auto &item : std::get<array_type>(source->value_)) {
                destination->emplace_back(clone_helper(item));
            }
        }

        // The destination is complete, references to its children remain valid
        for (std::size_t i = 0; i < source->size(); ++i) {
            const auto &child = source->at(i);
            if (child.is_container()) {
                queue.emplace_back(&child, &destination->at(i));
            }
        }
    }

    return copy;
}

bool owned_object::operator==(const owned_object &other) const
{
    std::vector<std::pair<const owned_object *, const owned_object *>> stack{{this, &other}};
    while (!stack.empty()) {
        auto [lhs, rhs] = stack.back();
        stack.pop_back();

        if (lhs->type() != rhs->type()) {
            return false;
        }

        switch (lhs->type()) {
        case object_type::array: {
            const auto &lhs_array = std::get<array_type>(lhs->value_);
            const auto &rhs_array = std::get<array_type>(rhs->value_);
            if (lhs_array.size() != rhs_array.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lhs_array.size(); ++i) {
                stack.emplace_back(&lhs_array[i], &rhs_array[i]);
            }
            break;
        }
        case object_type::map: {
            // Order is significant
            const auto &lhs_map = std::get<map_type>(lhs->value_);
            const auto &rhs_map = std::get<map_type>(rhs->value_);
            if (lhs_map.size() != rhs_map.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lhs_map.size(); ++i) {
                if (lhs_map[i].first != rhs_map[i].first) {
                    return false;
                }
                stack.emplace_back(&lhs_map[i].second, &rhs_map[i].second);
            }
            break;
        }
        case object_type::boolean:
            if (lhs->as<bool>() != rhs->as<bool>()) {
                return false;
            }
            break;
        case object_type::int64:
            if (lhs->as<int64_t>() != rhs->as<int64_t>()) {
                return false;
            }
            break;
        case object_type::uint64:
            if (lhs->as<uint64_t>() != rhs->as<uint64_t>()) {
                return false;
            }
            break;
        case object_type::float64:
            if (!(lhs->as<double>() == rhs->as<double>())) {
                return false;
            }
            break;
        case object_type::string:
            if (lhs->as<std::string_view>() != rhs->as<std::string_view>()) {
                return false;
            }
            break;
        case object_type::null:
        case object_type::invalid:
        default:
            break;
        }
    }
    return true;
}

} // namespace piiredact

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "object_type.hpp"

namespace piiredact {

// Owning, move-only representation of a decoded document. The default
// constructed object is invalid, i.e. outside of the set of supported types,
// all other objects are either null, a scalar or a container.
//
// Maps preserve insertion order and contain unique keys, emplacing an existing
// key replaces its value without changing its position.
class owned_object {
public:
    using array_type = std::vector<owned_object>;
    using map_type = std::vector<std::pair<std::string, owned_object>>;

    owned_object() = default;

    template <typename T>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    owned_object(T value)
        requires std::is_same_v<T, bool>
        : value_(std::in_place_type<bool>, value)
    {}

    template <typename T>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    owned_object(T value)
        requires std::is_integral_v<T> && std::is_signed_v<T>
        : value_(std::in_place_type<int64_t>, static_cast<int64_t>(value))
    {}

    template <typename T>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    owned_object(T value)
        requires std::is_integral_v<T> && std::is_unsigned_v<T> && (!std::is_same_v<T, bool>)
        : value_(std::in_place_type<uint64_t>, static_cast<uint64_t>(value))
    {}

    template <typename T>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    owned_object(T value)
        requires std::is_floating_point_v<T>
        : value_(std::in_place_type<double>, static_cast<double>(value))
    {}

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    owned_object(std::string value) : value_(std::in_place_type<std::string>, std::move(value)) {}
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    owned_object(std::string_view value) : value_(std::in_place_type<std::string>, value) {}
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    owned_object(const char *value) : value_(std::in_place_type<std::string>, value) {}

    // Nested containers are released iteratively, the depth of the tree is
    // not bounded by the stack.
    ~owned_object();
    owned_object(const owned_object &) = delete;
    owned_object &operator=(const owned_object &) = delete;
    owned_object(owned_object &&) noexcept = default;
    owned_object &operator=(owned_object &&) noexcept = default;

    static owned_object make_null() { return owned_object{std::in_place_type<std::nullptr_t>}; }
    static owned_object make_boolean(bool value) { return owned_object{value}; }
    static owned_object make_signed(int64_t value) { return owned_object{value}; }
    static owned_object make_unsigned(uint64_t value) { return owned_object{value}; }
    static owned_object make_float(double value) { return owned_object{value}; }
    static owned_object make_string(std::string_view value) { return owned_object{value}; }
    static owned_object make_array(std::size_t capacity = 0);
    static owned_object make_map(std::size_t capacity = 0);

    [[nodiscard]] object_type type() const noexcept;

    [[nodiscard]] bool is_container() const noexcept { return piiredact::is_container(type()); }
    [[nodiscard]] bool is_scalar() const noexcept { return piiredact::is_scalar(type()); }

    [[nodiscard]] bool is_map() const noexcept { return type() == object_type::map; }
    [[nodiscard]] bool is_array() const noexcept { return type() == object_type::array; }
    [[nodiscard]] bool is_string() const noexcept { return type() == object_type::string; }
    [[nodiscard]] bool is_null() const noexcept { return type() == object_type::null; }

    [[nodiscard]] bool is_valid() const noexcept { return type() != object_type::invalid; }
    [[nodiscard]] bool is_invalid() const noexcept { return type() == object_type::invalid; }

    // is<T> checks whether the underlying type is exactly the requested one,
    // numeric types are never converted.
    template <typename T>
    [[nodiscard]] bool is() const noexcept
        requires std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                 std::is_same_v<T, uint64_t> || std::is_same_v<T, double>
    {
        return std::holds_alternative<T>(value_);
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept
        requires std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>
    {
        return is_string();
    }

    // The caller must verify the type beforehand, std::bad_variant_access is
    // raised otherwise.
    template <typename T>
    [[nodiscard]] T as() const
        requires std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                 std::is_same_v<T, uint64_t> || std::is_same_v<T, double>
    {
        return std::get<T>(value_);
    }

    template <typename T>
    [[nodiscard]] T as() const
        requires std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>
    {
        return T{std::get<std::string>(value_)};
    }

    // Number of characters of a string or number of items of a container,
    // zero for any other type.
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    // Containers only, the index must be within bounds
    [[nodiscard]] const owned_object &at(std::size_t idx) const;
    [[nodiscard]] owned_object &at(std::size_t idx);
    // Maps only, the index must be within bounds
    [[nodiscard]] std::string_view key_at(std::size_t idx) const;

    // Maps only, returns nullptr if the key is not present
    [[nodiscard]] const owned_object *find(std::string_view key) const;

    owned_object &emplace_back(owned_object &&value);
    owned_object &emplace(std::string_view key, owned_object &&value);
    // Maps only, appends the key without looking for an existing one, the
    // caller must guarantee that the key isn't already present.
    owned_object &emplace_back(std::string_view key, owned_object &&value);

    [[nodiscard]] owned_object clone() const;

    bool operator==(const owned_object &other) const;

protected:
    using variant_type = std::variant<std::monostate, std::nullptr_t, bool, int64_t, uint64_t,
        double, std::string, array_type, map_type>;

    template <typename T, typename... Args>
    explicit owned_object(std::in_place_type_t<T> tag, Args &&...args)
        : value_(tag, std::forward<Args>(args)...)
    {}

    // Moves the children of a container into the provided vector, leaving the
    // container empty.
    void release_children(std::vector<owned_object> &children);

    variant_type value_;
};

} // namespace piiredact

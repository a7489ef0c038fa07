// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <utility>

namespace piiredact {

class exception : public std::exception {
public:
    explicit exception(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

// Raised when a value outside of the supported object types is found
class invalid_object : public exception {
public:
    explicit invalid_object(const std::string &path)
        : exception("invalid object found at '" + path + "'")
    {}
};

class parsing_error : public exception {
public:
    explicit parsing_error(const std::string &what) : exception(what) {}
};

class bad_cast : public exception {
public:
    bad_cast(const std::string &expected, const std::string &obtained)
        : exception("bad cast, expected '" + expected + "', obtained '" + obtained + "'")
    {}
};

} // namespace piiredact

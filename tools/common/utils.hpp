// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <yaml-cpp/yaml.h>

#include "object.hpp"
#include "piiredact.h"

namespace YAML {

class parsing_error : public std::exception {
public:
    explicit parsing_error(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    const std::string what_;
};

template <> struct as_if<piiredact::owned_object, void> {
    explicit as_if(const Node &node_) : node(node_) {}
    piiredact::owned_object operator()() const;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    const Node &node;
};

} // namespace YAML

const char *level_to_str(PIIREDACT_LOG_LEVEL level);

void log_cb(PIIREDACT_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

std::string read_file(std::string_view filename);

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <yaml-cpp/yaml.h>

#include "object.hpp"
#include "piiredact.h"
#include "common/utils.hpp"

using piiredact::owned_object;

namespace YAML {

namespace {

// NOLINTNEXTLINE(misc-no-recursion)
owned_object node_to_owned_object(const Node &node)
{
    switch (node.Type()) {
    case NodeType::Sequence: {
        auto parent = owned_object::make_array(node.size());
        for (auto it = node.begin(); it != node.end(); ++it) {
            parent.emplace_back(node_to_owned_object(*it));
        }
        return parent;
    }
    case NodeType::Map: {
        auto parent = owned_object::make_map(node.size());
        for (auto it = node.begin(); it != node.end(); ++it) {
            parent.emplace(it->first.as<std::string>(), node_to_owned_object(it->second));
        }
        return parent;
    }
    case NodeType::Scalar: {
        const std::string &value = node.Scalar();
        // Quoted scalars are always strings
        if (node.Tag() == "?") {
            if (uint64_t u = 0; convert<uint64_t>::decode(node, u)) {
                return owned_object{u};
            }
            if (int64_t i = 0; convert<int64_t>::decode(node, i)) {
                return owned_object{i};
            }
            if (double d = 0; convert<double>::decode(node, d)) {
                return owned_object{d};
            }
            // Skip the yes / no variants of boolean
            if (bool b = false; !value.empty() && value[0] != 'Y' && value[0] != 'y' &&
                                value[0] != 'n' && value[0] != 'N' &&
                                convert<bool>::decode(node, b)) {
                return owned_object{b};
            }
        }
        return owned_object{value};
    }
    case NodeType::Null:
        return owned_object::make_null();
    case NodeType::Undefined:
        return {};
    }

    throw parsing_error("Invalid YAML node type");
}

} // namespace

owned_object as_if<owned_object, void>::operator()() const { return node_to_owned_object(node); }

} // namespace YAML

const char *level_to_str(PIIREDACT_LOG_LEVEL level)
{
    switch (level) {
    case PIIREDACT_LOG_TRACE:
        return "trace";
    case PIIREDACT_LOG_DEBUG:
        return "debug";
    case PIIREDACT_LOG_ERROR:
        return "error";
    case PIIREDACT_LOG_WARN:
        return "warn";
    case PIIREDACT_LOG_INFO:
        return "info";
    case PIIREDACT_LOG_OFF:
        break;
    }

    return "off";
}

void log_cb(PIIREDACT_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream input_file(std::string{filename}, std::ios::in);
    if (!input_file) {
        throw std::system_error(errno, std::generic_category(), std::string{filename});
    }

    // Create a buffer equal to the file size
    std::string buffer;
    input_file.seekg(0, std::ios::end);
    buffer.resize(input_file.tellg());
    input_file.seekg(0, std::ios::beg);

    input_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    input_file.close();
    return buffer;
}

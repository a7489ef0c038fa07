// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include <fmt/format.h> // IWYU pragma: keep

#include "piiredact.h"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
        if (*path++ == '/') {
            base = path;
        }
    }
    return base;
}

#define PIIREDACT_LOG_HELPER(level, function, file, line, fmt_str, ...)                            \
    {                                                                                              \
        if (piiredact::logger::valid(level)) {                                                     \
            try {                                                                                  \
                constexpr const char *filename = base_name(file);                                  \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                piiredact::logger::log(                                                            \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (const std::exception &) {}                                                    \
        }                                                                                          \
    }

#define PIIREDACT_LOG(level, fmt, ...)                                                             \
    PIIREDACT_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define PIIREDACT_TRACE(fmt, ...) PIIREDACT_LOG(piiredact::log_level::trace, fmt, ##__VA_ARGS__)
#define PIIREDACT_DEBUG(fmt, ...) PIIREDACT_LOG(piiredact::log_level::debug, fmt, ##__VA_ARGS__)
#define PIIREDACT_INFO(fmt, ...) PIIREDACT_LOG(piiredact::log_level::info, fmt, ##__VA_ARGS__)
#define PIIREDACT_WARN(fmt, ...) PIIREDACT_LOG(piiredact::log_level::warn, fmt, ##__VA_ARGS__)
#define PIIREDACT_ERROR(fmt, ...) PIIREDACT_LOG(piiredact::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace piiredact {

// This enum is 32 bit for compatibility with PIIREDACT_LOG_LEVEL
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t { trace, debug, info, warn, error, off };

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::error:
        return "error";
    case log_level::warn:
        return "warn";
    case log_level::info:
        return "info";
    case log_level::off:
        break;
    }

    return "off";
}

// The callback and level may be replaced while other threads are masking,
// both are read atomically on every log statement.
class logger {
public:
    using log_cb_type = piiredact_log_cb;

    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level)
    {
        return cb.load(std::memory_order_relaxed) != nullptr &&
               level >= min_level.load(std::memory_order_relaxed);
    }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, std::size_t length);

private:
    static std::atomic<log_cb_type> cb;
    static std::atomic<log_level> min_level;
};

} // namespace piiredact

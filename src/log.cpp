// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "log.hpp"

namespace piiredact {

std::atomic<logger::log_cb_type> logger::cb{nullptr};
std::atomic<log_level> logger::min_level{log_level::off};

void logger::init(log_cb_type cb, log_level min_level)
{
    logger::cb.store(cb, std::memory_order_release);
    logger::min_level.store(min_level, std::memory_order_relaxed);
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, std::size_t length)
{
    // The callback may be reset to null by the binding at any time
    auto *current_cb = logger::cb.load(std::memory_order_acquire);
    if (current_cb != nullptr) {
        current_cb(static_cast<PIIREDACT_LOG_LEVEL>(level), function, file, line, message, length);
    }
}

} // namespace piiredact

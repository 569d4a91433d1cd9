// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>

#include "log.hpp"

namespace bras {

logger::log_cb_type logger::cb = nullptr;
log_level logger::min_level = log_level::off;

void logger::init(log_cb_type cb, log_level min_level)
{
    logger::cb = cb;
    logger::min_level = min_level;
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    logger::cb(static_cast<BRAS_LOG_LEVEL>(level), function, file, line, message, length);
}

} // namespace bras

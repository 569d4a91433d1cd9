// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

#include "bras.h"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
#ifdef _WIN32
        char separator = '\\';
#else
        const char separator = '/';
#endif
        if (*path++ == separator) {
            base = path;
        }
    }
    return base;
}

#define BRAS_LOG_HELPER(level, function, file, line, fmt_str, ...)                                 \
    {                                                                                              \
        if (bras::logger::valid(level)) {                                                          \
            try {                                                                                  \
                constexpr const char *filename = base_name(file);                                  \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                bras::logger::log(                                                                 \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (const std::exception &) {}                                                    \
        }                                                                                          \
    }

#define BRAS_LOG(level, fmt, ...)                                                                  \
    BRAS_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define BRAS_TRACE(fmt, ...) BRAS_LOG(bras::log_level::trace, fmt, ##__VA_ARGS__)
#define BRAS_DEBUG(fmt, ...) BRAS_LOG(bras::log_level::debug, fmt, ##__VA_ARGS__)
#define BRAS_INFO(fmt, ...) BRAS_LOG(bras::log_level::info, fmt, ##__VA_ARGS__)
#define BRAS_WARN(fmt, ...) BRAS_LOG(bras::log_level::warn, fmt, ##__VA_ARGS__)
#define BRAS_ERROR(fmt, ...) BRAS_LOG(bras::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace bras {

// Same values as BRAS_LOG_LEVEL
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

class logger {
public:
    using log_cb_type = bras_log_cb;

    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level) { return cb != nullptr && level >= min_level; }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static log_cb_type cb;
    static log_level min_level;
};

} // namespace bras

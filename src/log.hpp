// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

#include "urlguard.h"

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

#define URLGUARD_LOG_HELPER(level, function, file, line, fmt_str, ...)                             \
    {                                                                                              \
        if (urlguard::logger::valid(level)) {                                                      \
            constexpr const char *filename = base_name(file);                                      \
            try {                                                                                  \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                urlguard::logger::log(                                                             \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (const std::exception &log_error) {                                            \
                const auto *reason = log_error.what();                                             \
                urlguard::logger::log(level, function, filename, line, reason, strlen(reason));    \
            }                                                                                      \
        }                                                                                          \
    }

#define URLGUARD_LOG(level, fmt, ...)                                                              \
    URLGUARD_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define URLGUARD_TRACE(fmt, ...) URLGUARD_LOG(URLGUARD_LOG_TRACE, fmt, ##__VA_ARGS__)
#define URLGUARD_DEBUG(fmt, ...) URLGUARD_LOG(URLGUARD_LOG_DEBUG, fmt, ##__VA_ARGS__)
#define URLGUARD_INFO(fmt, ...) URLGUARD_LOG(URLGUARD_LOG_INFO, fmt, ##__VA_ARGS__)
#define URLGUARD_WARN(fmt, ...) URLGUARD_LOG(URLGUARD_LOG_WARN, fmt, ##__VA_ARGS__)
#define URLGUARD_ERROR(fmt, ...) URLGUARD_LOG(URLGUARD_LOG_ERROR, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace urlguard {

inline std::string_view log_level_to_str(URLGUARD_LOG_LEVEL level)
{
    switch (level) {
    case URLGUARD_LOG_TRACE:
        return "trace";
    case URLGUARD_LOG_DEBUG:
        return "debug";
    case URLGUARD_LOG_ERROR:
        return "error";
    case URLGUARD_LOG_WARN:
        return "warn";
    case URLGUARD_LOG_INFO:
        return "info";
    case URLGUARD_LOG_OFF:
        break;
    }

    return "off";
}

class logger {
public:
    static void init(urlguard_log_cb cb, URLGUARD_LOG_LEVEL min_level);
    static bool valid(URLGUARD_LOG_LEVEL level) { return cb != nullptr && level >= min_level; }
    static void log(URLGUARD_LOG_LEVEL level, const char *function, const char *file,
        unsigned line, const char *message, size_t length);

private:
    static urlguard_log_cb cb;
    static URLGUARD_LOG_LEVEL min_level;
};

} // namespace urlguard

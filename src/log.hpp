// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>

#include <docval.h>
#include <fmt/core.h> // IWYU pragma: keep

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

#define DOCVAL_LOG_HELPER(level, function, file, line, fmt_str, ...)                               \
    {                                                                                              \
        if (docval::logger::valid(level)) {                                                        \
            try {                                                                                  \
                constexpr const char *filename = base_name(file);                                  \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                docval::logger::log(                                                               \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (...) {}                                                                       \
        }                                                                                          \
    }

#define DOCVAL_LOG(level, fmt, ...)                                                                \
    DOCVAL_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define DOCVAL_TRACE(fmt, ...) DOCVAL_LOG(DOCVAL_LOG_TRACE, fmt, ##__VA_ARGS__)
#define DOCVAL_DEBUG(fmt, ...) DOCVAL_LOG(DOCVAL_LOG_DEBUG, fmt, ##__VA_ARGS__)
#define DOCVAL_INFO(fmt, ...) DOCVAL_LOG(DOCVAL_LOG_INFO, fmt, ##__VA_ARGS__)
#define DOCVAL_WARN(fmt, ...) DOCVAL_LOG(DOCVAL_LOG_WARN, fmt, ##__VA_ARGS__)
#define DOCVAL_ERROR(fmt, ...) DOCVAL_LOG(DOCVAL_LOG_ERROR, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace docval {

const char *log_level_to_str(DOCVAL_LOG_LEVEL level);

class logger {
public:
    static void init(docval_log_cb cb, DOCVAL_LOG_LEVEL min_level);
    static bool valid(DOCVAL_LOG_LEVEL level) { return cb != nullptr && level >= min_level; }
    static void log(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static docval_log_cb cb;
    static DOCVAL_LOG_LEVEL min_level;
};

} // namespace docval

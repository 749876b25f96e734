// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>

#include "log.hpp"

namespace docval {

docval_log_cb logger::cb = nullptr;
DOCVAL_LOG_LEVEL logger::min_level = DOCVAL_LOG_OFF;

const char *log_level_to_str(DOCVAL_LOG_LEVEL level)
{
    switch (level) {
    case DOCVAL_LOG_TRACE:
        return "trace";
    case DOCVAL_LOG_DEBUG:
        return "debug";
    case DOCVAL_LOG_ERROR:
        return "error";
    case DOCVAL_LOG_WARN:
        return "warn";
    case DOCVAL_LOG_INFO:
        return "info";
    case DOCVAL_LOG_OFF:
        break;
    }

    return "off";
}

void logger::init(docval_log_cb cb, DOCVAL_LOG_LEVEL min_level)
{
    logger::cb = cb;
    logger::min_level = min_level;
}

void logger::log(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    logger::cb(level, function, file, line, message, length);
}

} // namespace docval

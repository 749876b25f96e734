// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "docval.h"
#include "utils.hpp"

#define expect(lhs, rhs) \
    try { \
        check_equals(lhs, rhs, __LINE__, __func__); \
    } catch (const assert_exception &e) { \
        throw; \
    } catch (const std::exception &e) { \
        throw assert_exception(e.what(), __LINE__, __func__); \
    }

class assert_exception : public std::exception
{
public:
    assert_exception(std::string_view what, int loc, std::string_view fn) {
        std::stringstream ss;
        ss << fn << "(" << loc << "): " << what;
        what_ = std::move(ss.str());
    }

    template <typename T>
    assert_exception(const T &lhs, const T &rhs, int loc, std::string_view fn) {
        std::stringstream ss;
        ss << fn << "(" << loc << "): " << lhs << " != " << rhs;
        what_ = std::move(ss.str());
    }
    const char* what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

template<typename T>
inline void check_equals(const T &lhs, const T &rhs, int loc, std::string_view fn)
{
    if (lhs != rhs) { throw assert_exception(lhs, rhs, loc, fn); }
}

inline std::string to_string(bool val) { return val ? "true" : "false"; }

template<>
inline void check_equals(const bool &lhs, const bool &rhs, int loc, std::string_view fn)
{
    if (lhs != rhs) {
        throw assert_exception(to_string(lhs), to_string(rhs), loc, fn);
    }
}

template<>
inline void check_equals(const DOCVAL_RET_CODE &lhs, const DOCVAL_RET_CODE &rhs,
        int loc, std::string_view fn)
{
    if (lhs != rhs) {
        throw assert_exception(std::string_view{docval_ret_code_to_string(lhs)},
            std::string_view{docval_ret_code_to_string(rhs)}, loc, fn);
    }
}

template<>
inline void check_equals(const DOCVAL_DOC_KIND &lhs, const DOCVAL_DOC_KIND &rhs,
        int loc, std::string_view fn)
{
    if (lhs != rhs) {
        throw assert_exception(to_string(lhs), to_string(rhs), loc, fn);
    }
}

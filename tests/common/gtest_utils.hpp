// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <ostream>
#include <string_view>

#include "tax_id.hpp"
#include "validation/validation_error.hpp"

#define EXPECT_STR(a, b) EXPECT_EQ(std::string_view{a}, std::string_view{b})

namespace docval {

// Printers used by gtest when an expectation fails
inline void PrintTo(tax_id_kind kind, ::std::ostream *os) { *os << to_string(kind); }
inline void PrintTo(tax_id_error error, ::std::ostream *os) { *os << to_string(error); }

inline void PrintTo(const validation_error &error, ::std::ostream *os)
{
    *os << "{code: " << error.code << ", message: " << error.message << "}";
}

} // namespace docval

namespace docval::test {

// Matches a tax_id_result with the given error
MATCHER_P(HasError, error, "")
{
    return arg.error.has_value() && *arg.error == error;
}

MATCHER_P(HasKind, kind, "") { return arg.kind.has_value() && *arg.kind == kind; }

MATCHER(IsValid, "") { return arg.valid(); }

MATCHER_P(HasCode, code, "") { return arg.code == code; }

} // namespace docval::test

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2022 Datadog, Inc.

#include <limits>

#include "utils.hpp"

#include "common/gtest_utils.hpp"

using namespace docval;

namespace {
constexpr char char_min = std::numeric_limits<char>::min();
constexpr char char_max = std::numeric_limits<char>::max();

TEST(TestUtils, IsDigit)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= '0' && c <= '9') {
            EXPECT_TRUE(isdigit(c));
        } else {
            EXPECT_FALSE(isdigit(c));
        }
    }
}

TEST(TestUtils, IsUpper)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= 'A' && c <= 'Z') {
            EXPECT_TRUE(isupper(c));
        } else {
            EXPECT_FALSE(isupper(c));
        }
    }
}

TEST(TestUtils, ToLower)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= 'A' && c <= 'Z') {
            EXPECT_EQ(tolower(c), c - 'A' + 'a');
        } else {
            EXPECT_EQ(tolower(c), c);
        }
    }
}

TEST(TestUtils, StringIequals)
{
    EXPECT_TRUE(string_iequals("cpf", "CPF"));
    EXPECT_TRUE(string_iequals("CnPj", "cnpj"));
    EXPECT_TRUE(string_iequals("", ""));
    EXPECT_FALSE(string_iequals("cpf", "cnpj"));
    EXPECT_FALSE(string_iequals("cpf", "cpf "));
}

TEST(TestUtils, IndexToId)
{
    EXPECT_STR(index_to_id(0), "index:0");
    EXPECT_STR(index_to_id(42), "index:42");
}

} // namespace

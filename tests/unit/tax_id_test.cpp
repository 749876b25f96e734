// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "exception.hpp"
#include "tax_id.hpp"

#include "common/gtest_utils.hpp"

using namespace docval;
using namespace docval::test;

namespace {

TEST(TestTaxId, ValidCpf)
{
    EXPECT_THAT(validate_tax_id("12345678909"), IsValid());
    EXPECT_THAT(validate_tax_id("123.456.789-09"), IsValid());
    EXPECT_THAT(validate_tax_id("529.982.247-25"), IsValid());

    auto result = validate_tax_id("123.456.789-09");
    EXPECT_THAT(result, HasKind(tax_id_kind::cpf));
}

TEST(TestTaxId, ValidCnpj)
{
    EXPECT_THAT(validate_tax_id("12345678000195"), IsValid());
    EXPECT_THAT(validate_tax_id("12.345.678/0001-95"), IsValid());
    EXPECT_THAT(validate_tax_id("11.222.333/0001-81"), IsValid());

    auto result = validate_tax_id("12.345.678/0001-95");
    EXPECT_THAT(result, HasKind(tax_id_kind::cnpj));
}

TEST(TestTaxId, AllDigitsEqual)
{
    EXPECT_THAT(validate_tax_id("000.000.000-00"), HasError(tax_id_error::all_digits_equal));
    EXPECT_THAT(validate_tax_id("00.000.000/0000-00"), HasError(tax_id_error::all_digits_equal));
    EXPECT_THAT(validate_tax_id("11111111111"), HasError(tax_id_error::all_digits_equal));
    EXPECT_THAT(validate_tax_id("99999999999999"), HasError(tax_id_error::all_digits_equal));

    // The kind is known, the sequence is rejected before the checksum
    EXPECT_THAT(validate_tax_id("000.000.000-00"), HasKind(tax_id_kind::cpf));
    EXPECT_THAT(validate_tax_id("00.000.000/0000-00"), HasKind(tax_id_kind::cnpj));
}

TEST(TestTaxId, InvalidLength)
{
    EXPECT_THAT(validate_tax_id("123.456.789"), HasError(tax_id_error::invalid_length));
    EXPECT_THAT(validate_tax_id("12.345.678/0001"), HasError(tax_id_error::invalid_length));
    EXPECT_THAT(validate_tax_id("123"), HasError(tax_id_error::invalid_length));
    EXPECT_THAT(validate_tax_id("1234567890"), HasError(tax_id_error::invalid_length));
    EXPECT_THAT(validate_tax_id("123456789012"), HasError(tax_id_error::invalid_length));
    EXPECT_THAT(validate_tax_id("1234567890123"), HasError(tax_id_error::invalid_length));
    EXPECT_THAT(validate_tax_id("123456789012345"), HasError(tax_id_error::invalid_length));

    // Equal digits don't matter if the length is wrong
    EXPECT_THAT(validate_tax_id("0000000000"), HasError(tax_id_error::invalid_length));

    EXPECT_FALSE(validate_tax_id("123").kind.has_value());
}

TEST(TestTaxId, InvalidInput)
{
    EXPECT_THAT(validate_tax_id(""), HasError(tax_id_error::invalid_input));
    EXPECT_THAT(validate_tax_id("abc"), HasError(tax_id_error::invalid_input));
    EXPECT_THAT(validate_tax_id("../-  "), HasError(tax_id_error::invalid_input));
    EXPECT_THAT(validate_tax_id("\xc3\xa9\xc3\xa7"), HasError(tax_id_error::invalid_input));

    EXPECT_FALSE(validate_tax_id("").kind.has_value());
}

TEST(TestTaxId, InvalidChecksum)
{
    EXPECT_THAT(validate_tax_id("12.345.678/0001-99"), HasError(tax_id_error::invalid_checksum));
    EXPECT_THAT(validate_tax_id("123.456.789-00"), HasError(tax_id_error::invalid_checksum));
    EXPECT_THAT(validate_tax_id("529.982.247-24"), HasError(tax_id_error::invalid_checksum));
    EXPECT_THAT(validate_tax_id("529.982.247-15"), HasError(tax_id_error::invalid_checksum));
    EXPECT_THAT(validate_tax_id("11.222.333/0001-80"), HasError(tax_id_error::invalid_checksum));

    EXPECT_THAT(validate_tax_id("12.345.678/0001-99"), HasKind(tax_id_kind::cnpj));
}

TEST(TestTaxId, DigitsWithinGarbage)
{
    // Sanitized to 1237890
    EXPECT_THAT(validate_tax_id("123.abc.789-0x"), HasError(tax_id_error::invalid_length));

    EXPECT_THAT(validate_tax_id("cpf: 123 456 789 / 09"), IsValid());
    EXPECT_THAT(validate_tax_id("CNPJ n\xc2\xba 12.345.678/0001-95"), IsValid());
}

TEST(TestTaxId, FormattingInvariance)
{
    const std::vector<std::pair<std::string, std::string>> samples{
        {"12345678909", "123.456.789-09"},
        {"12345678000195", "12.345.678/0001-95"},
        {"12345678000199", "12.345.678/0001-99"},
        {"00000000000", "000.000.000-00"},
        {"123456789", "123.456.789"},
    };

    for (const auto &[plain, formatted] : samples) {
        auto lhs = validate_tax_id(plain);
        auto rhs = validate_tax_id(formatted);
        EXPECT_EQ(lhs.error, rhs.error) << plain;
        EXPECT_EQ(lhs.kind, rhs.kind) << plain;
    }
}

TEST(TestTaxId, Deterministic)
{
    for (const auto *value : {"123.456.789-09", "12.345.678/0001-99", "", "123"}) {
        auto first = validate_tax_id(value);
        auto second = validate_tax_id(value);
        EXPECT_EQ(first.error, second.error);
        EXPECT_EQ(first.kind, second.kind);
    }
}

TEST(TestTaxId, ConcurrentValidation)
{
    const std::array<std::string, 8> values{"123.456.789-09", "529.982.247-25",
        "12.345.678/0001-95", "11.222.333/0001-81", "12.345.678/0001-99", "000.000.000-00",
        "123.456.789", "abc"};

    std::vector<tax_id_result> expected;
    expected.reserve(values.size());
    for (const auto &value : values) { expected.emplace_back(validate_tax_id(value)); }

    std::atomic<unsigned> mismatches{0};
    std::vector<std::thread> workers;
    for (unsigned t = 0; t < 8; ++t) {
        workers.emplace_back([&values, &expected, &mismatches, t]() {
            for (unsigned i = 0; i < 1000; ++i) {
                const auto idx = (i + t) % values.size();
                auto result = validate_tax_id(values[idx]);
                if (result.error != expected[idx].error || result.kind != expected[idx].kind) {
                    ++mismatches;
                }
            }
        });
    }

    for (auto &worker : workers) { worker.join(); }

    EXPECT_EQ(mismatches.load(), 0U);
    EXPECT_THAT(expected[0], IsValid());
    EXPECT_THAT(expected[4], HasError(tax_id_error::invalid_checksum));
}

TEST(TestTaxId, Sanitize)
{
    EXPECT_STR(sanitize_tax_id("123.456.789-09"), "12345678909");
    EXPECT_STR(sanitize_tax_id("12.345.678/0001-95"), "12345678000195");
    EXPECT_STR(sanitize_tax_id("123.abc.789-0x"), "1237890");
    EXPECT_STR(sanitize_tax_id("\xd9\xa3 1 \xef\xbc\x92"), "1");
    EXPECT_TRUE(sanitize_tax_id("").empty());
    EXPECT_TRUE(sanitize_tax_id("abc").empty());

    // Idempotent
    for (const auto *value : {"123.456.789-09", "x1y2z3", "", "0"}) {
        auto once = sanitize_tax_id(value);
        EXPECT_EQ(sanitize_tax_id(once), once);
    }
}

TEST(TestTaxId, Classify)
{
    EXPECT_EQ(classify_tax_id("12345678909"), tax_id_kind::cpf);
    EXPECT_EQ(classify_tax_id("12345678000195"), tax_id_kind::cnpj);
    EXPECT_FALSE(classify_tax_id("").has_value());
    EXPECT_FALSE(classify_tax_id("1234567890").has_value());
    EXPECT_FALSE(classify_tax_id("123456789012").has_value());
    EXPECT_FALSE(classify_tax_id("123456789012345").has_value());
}

TEST(TestTaxId, HasAllEqualDigits)
{
    EXPECT_TRUE(has_all_equal_digits("11111111111"));
    EXPECT_TRUE(has_all_equal_digits("0"));
    EXPECT_FALSE(has_all_equal_digits("11111111112"));
    EXPECT_FALSE(has_all_equal_digits("21111111111"));
    EXPECT_FALSE(has_all_equal_digits(""));
}

TEST(TestTaxId, Weights)
{
    EXPECT_EQ(standard_length(tax_id_kind::cpf), 11U);
    EXPECT_EQ(standard_length(tax_id_kind::cnpj), 14U);

    for (auto kind : {tax_id_kind::cpf, tax_id_kind::cnpj}) {
        EXPECT_EQ(multiplier_weights(kind).size(), standard_length(kind) - 1);
    }

    auto cpf = multiplier_weights(tax_id_kind::cpf);
    EXPECT_THAT(std::vector<uint8_t>(cpf.begin(), cpf.end()),
        ::testing::ElementsAre(11, 10, 9, 8, 7, 6, 5, 4, 3, 2));

    auto cnpj = multiplier_weights(tax_id_kind::cnpj);
    EXPECT_THAT(std::vector<uint8_t>(cnpj.begin(), cnpj.end()),
        ::testing::ElementsAre(6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2));
}

TEST(TestTaxId, ComputeCheckDigit)
{
    auto cpf = multiplier_weights(tax_id_kind::cpf);
    // Remainder 1, below 2
    EXPECT_EQ(compute_check_digit("123456789", cpf.subspan(1)), 0U);
    EXPECT_EQ(compute_check_digit("1234567890", cpf), 9U);
    EXPECT_EQ(compute_check_digit("529982247", cpf.subspan(1)), 2U);
    EXPECT_EQ(compute_check_digit("5299822472", cpf), 5U);

    auto cnpj = multiplier_weights(tax_id_kind::cnpj);
    EXPECT_EQ(compute_check_digit("123456780001", cnpj.subspan(1)), 9U);
    EXPECT_EQ(compute_check_digit("1234567800019", cnpj), 5U);
}

TEST(TestTaxId, ComputeCheckDigitMismatchedWeights)
{
    auto cpf = multiplier_weights(tax_id_kind::cpf);
    EXPECT_THROW(compute_check_digit("12345678", cpf), internal_error);
    EXPECT_THROW(compute_check_digit("12345678901", cpf), internal_error);
    EXPECT_THROW(compute_check_digit("", cpf), internal_error);
}

TEST(TestTaxId, ComputeCheckDigitNonDigit)
{
    auto cpf = multiplier_weights(tax_id_kind::cpf);
    EXPECT_THROW(compute_check_digit("12345678a", cpf.subspan(1)), internal_error);
    EXPECT_THROW(compute_check_digit("123.45678", cpf.subspan(1)), internal_error);
    EXPECT_THROW(compute_check_digit(" 23456789", cpf.subspan(1)), internal_error);

    auto cnpj = multiplier_weights(tax_id_kind::cnpj);
    EXPECT_THROW(compute_check_digit("12345678/001", cnpj.subspan(1)), internal_error);
}

TEST(TestTaxId, Strings)
{
    EXPECT_STR(to_string(tax_id_kind::cpf), "cpf");
    EXPECT_STR(to_string(tax_id_kind::cnpj), "cnpj");

    EXPECT_STR(to_string(tax_id_error::invalid_input), "invalid_input");
    EXPECT_STR(to_string(tax_id_error::invalid_length), "invalid_length");
    EXPECT_STR(to_string(tax_id_error::all_digits_equal), "all_digits_equal");
    EXPECT_STR(to_string(tax_id_error::invalid_checksum), "invalid_checksum");

    EXPECT_STR(describe(tax_id_error::invalid_input), "Invalid input");
    EXPECT_STR(describe(tax_id_error::invalid_length), "Invalid length");
    EXPECT_STR(describe(tax_id_error::all_digits_equal), "All digits are equal");
    EXPECT_STR(describe(tax_id_error::invalid_checksum), "Invalid checksum");

    EXPECT_EQ(tax_id_kind_from_string("cpf"), tax_id_kind::cpf);
    EXPECT_EQ(tax_id_kind_from_string("CNPJ"), tax_id_kind::cnpj);
    EXPECT_FALSE(tax_id_kind_from_string("rg").has_value());
    EXPECT_FALSE(tax_id_kind_from_string("").has_value());
}

} // namespace

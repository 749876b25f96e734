// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "exception.hpp"
#include "tax_id.hpp"
#include "utils.hpp"

namespace docval {

namespace {

constexpr unsigned validation_modulus = 11;

constexpr std::array<uint8_t, cpf_standard_length - 1> cpf_weights{
    11, 10, 9, 8, 7, 6, 5, 4, 3, 2};
constexpr std::array<uint8_t, cnpj_standard_length - 1> cnpj_weights{
    6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

bool is_valid_check_digits(std::string_view digits, tax_id_kind kind)
{
    const auto length = standard_length(kind);
    const auto weights = multiplier_weights(kind);

    const auto first = compute_check_digit(digits.substr(0, length - 2), weights.subspan(1));
    const auto second = compute_check_digit(digits.substr(0, length - 1), weights);

    const std::array<char, 2> computed{
        static_cast<char>('0' + first), static_cast<char>('0' + second)};
    return digits.substr(length - 2) == std::string_view{computed.data(), computed.size()};
}

} // namespace

std::size_t standard_length(tax_id_kind kind) noexcept
{
    return kind == tax_id_kind::cpf ? cpf_standard_length : cnpj_standard_length;
}

std::span<const uint8_t> multiplier_weights(tax_id_kind kind) noexcept
{
    if (kind == tax_id_kind::cpf) {
        return cpf_weights;
    }
    return cnpj_weights;
}

std::string sanitize_tax_id(std::string_view value)
{
    std::string digits;
    digits.reserve(cnpj_standard_length);
    for (auto c : value) {
        if (isdigit(c)) {
            digits.push_back(c);
        }
    }
    return digits;
}

std::optional<tax_id_kind> classify_tax_id(std::string_view digits) noexcept
{
    switch (digits.size()) {
    case cpf_standard_length:
        return tax_id_kind::cpf;
    case cnpj_standard_length:
        return tax_id_kind::cnpj;
    default:
        break;
    }
    return std::nullopt;
}

bool has_all_equal_digits(std::string_view digits) noexcept
{
    if (digits.empty()) {
        return false;
    }
    return digits.find_first_not_of(digits[0]) == std::string_view::npos;
}

unsigned compute_check_digit(std::string_view digits, std::span<const uint8_t> weights)
{
    if (digits.size() != weights.size()) {
        throw internal_error(fmt::format(
            "{} digits provided for {} multiplier weights", digits.size(), weights.size()));
    }

    unsigned sum = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (!isdigit(digits[i])) {
            throw internal_error(fmt::format("non-digit character at position {}", i));
        }
        sum += static_cast<unsigned>(digits[i] - '0') * weights[i];
    }

    const auto remainder = sum % validation_modulus;
    return remainder < 2 ? 0 : validation_modulus - remainder;
}

tax_id_result validate_tax_id(std::string_view value)
{
    const auto digits = sanitize_tax_id(value);
    if (digits.empty()) {
        return {std::nullopt, tax_id_error::invalid_input};
    }

    auto kind = classify_tax_id(digits);
    if (!kind.has_value()) {
        return {std::nullopt, tax_id_error::invalid_length};
    }

    if (has_all_equal_digits(digits)) {
        return {kind, tax_id_error::all_digits_equal};
    }

    if (!is_valid_check_digits(digits, *kind)) {
        return {kind, tax_id_error::invalid_checksum};
    }

    return {kind, std::nullopt};
}

std::string_view to_string(tax_id_kind kind)
{
    switch (kind) {
    case tax_id_kind::cpf:
        return "cpf";
    case tax_id_kind::cnpj:
        return "cnpj";
    }
    return "unknown";
}

std::string_view to_string(tax_id_error error)
{
    switch (error) {
    case tax_id_error::invalid_input:
        return "invalid_input";
    case tax_id_error::invalid_length:
        return "invalid_length";
    case tax_id_error::all_digits_equal:
        return "all_digits_equal";
    case tax_id_error::invalid_checksum:
        return "invalid_checksum";
    }
    return "unknown";
}

std::string_view describe(tax_id_error error)
{
    switch (error) {
    case tax_id_error::invalid_input:
        return "Invalid input";
    case tax_id_error::invalid_length:
        return "Invalid length";
    case tax_id_error::all_digits_equal:
        return "All digits are equal";
    case tax_id_error::invalid_checksum:
        return "Invalid checksum";
    }
    return "Unknown error";
}

std::optional<tax_id_kind> tax_id_kind_from_string(std::string_view str)
{
    if (string_iequals(str, "cpf")) {
        return tax_id_kind::cpf;
    }

    if (string_iequals(str, "cnpj")) {
        return tax_id_kind::cnpj;
    }

    return std::nullopt;
}

} // namespace docval

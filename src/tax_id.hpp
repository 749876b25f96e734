// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace docval {

// CPF identifies individuals, CNPJ identifies companies
enum class tax_id_kind : uint8_t { cpf, cnpj };

enum class tax_id_error : uint8_t {
    invalid_input,
    invalid_length,
    all_digits_equal,
    invalid_checksum,
};

struct tax_id_result {
    // Only available once the number of digits has been classified
    std::optional<tax_id_kind> kind{};
    // Unset if the document is valid
    std::optional<tax_id_error> error{};

    [[nodiscard]] bool valid() const noexcept { return !error.has_value(); }
};

constexpr std::size_t cpf_standard_length = 11;
constexpr std::size_t cnpj_standard_length = 14;

[[nodiscard]] std::size_t standard_length(tax_id_kind kind) noexcept;

// Multipliers used for the second check digit, the first one skips the
// leading weight. There is one weight per digit excluding the last one.
[[nodiscard]] std::span<const uint8_t> multiplier_weights(tax_id_kind kind) noexcept;

// Drops everything other than ASCII decimal digits, preserving order.
std::string sanitize_tax_id(std::string_view value);

// Expects a sanitized string
std::optional<tax_id_kind> classify_tax_id(std::string_view digits) noexcept;

bool has_all_equal_digits(std::string_view digits) noexcept;

// Weighted modulo 11 sum of the given digits. Expects ASCII digits only, as
// produced by sanitize_tax_id; throws internal_error on any other character or
// if the number of digits and weights differ.
unsigned compute_check_digit(std::string_view digits, std::span<const uint8_t> weights);

tax_id_result validate_tax_id(std::string_view value);

std::string_view to_string(tax_id_kind kind);
std::string_view to_string(tax_id_error error);
std::string_view describe(tax_id_error error);
std::optional<tax_id_kind> tax_id_kind_from_string(std::string_view str);

} // namespace docval

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "tax_id.hpp"
#include "validation/field_validator.hpp"
#include "validation/validation_error.hpp"

namespace docval {

namespace {

validation_error make_error(
    std::string_view code, std::string_view message, std::string_view value)
{
    validation_error error{std::string{code}, std::string{message}};
    error.params.emplace("value", value);
    return error;
}

std::string_view display_name(tax_id_kind kind)
{
    return kind == tax_id_kind::cpf ? "CPF" : "CNPJ";
}

} // namespace

std::optional<validation_error> validate_tax_id_field(std::string_view value)
{
    return tax_id_field_validator{}(value);
}

std::optional<validation_error> tax_id_field_validator::operator()(std::string_view value) const
{
    auto result = validate_tax_id(value);
    if (!result.valid()) {
        auto error = make_error(to_string(*result.error), describe(*result.error), value);
        if (result.kind.has_value()) {
            error.params.emplace("kind", to_string(*result.kind));
        }
        return error;
    }

    if (kind_.has_value() && result.kind != kind_) {
        auto error = make_error("unexpected_kind",
            fmt::format("Expected a {}, found a {}", display_name(*kind_),
                display_name(*result.kind)),
            value);
        error.params.emplace("kind", to_string(*result.kind));
        error.params.emplace("expected", to_string(*kind_));
        return error;
    }

    return std::nullopt;
}

} // namespace docval

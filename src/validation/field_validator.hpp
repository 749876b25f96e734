// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string_view>

#include "tax_id.hpp"
#include "validation/validation_error.hpp"

namespace docval {

// Same outcome as validate_tax_id, reshaped as a named validation error
std::optional<validation_error> validate_tax_id_field(std::string_view value);

class tax_id_field_validator {
public:
    tax_id_field_validator() = default;
    explicit tax_id_field_validator(std::optional<tax_id_kind> kind) : kind_(kind) {}

    // A valid document of another kind is reported as unexpected_kind
    [[nodiscard]] std::optional<validation_error> operator()(std::string_view value) const;

    [[nodiscard]] std::optional<tax_id_kind> kind() const noexcept { return kind_; }

protected:
    std::optional<tax_id_kind> kind_;
};

} // namespace docval

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <rapidjson/document.h>

#include "tax_id.hpp"
#include "validation/field_validator.hpp"
#include "validation/validation_error.hpp"

namespace docval {

struct field_rule {
    std::string id;
    // Name under which errors are reported
    std::string field;
    // Location of the value within the record, starting from the root object
    std::vector<std::string> key_path;
    // Unset to accept both CPF and CNPJ
    std::optional<tax_id_kind> kind{};
    bool required{true};
};

class schema {
public:
    schema() = default;
    explicit schema(std::vector<field_rule> rules) : rules_(std::move(rules)) {}

    [[nodiscard]] const std::vector<field_rule> &rules() const noexcept { return rules_; }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

    [[nodiscard]] validation_errors validate(const rapidjson::Value &record) const;
    // Throws parsing_error if the record isn't valid JSON
    [[nodiscard]] validation_errors validate(std::string_view json) const;

protected:
    std::vector<field_rule> rules_;
};

} // namespace docval

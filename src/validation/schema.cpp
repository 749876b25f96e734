// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "exception.hpp"
#include "log.hpp"
#include "validation/field_validator.hpp"
#include "validation/schema.hpp"
#include "validation/validation_error.hpp"

namespace docval {

namespace {

const rapidjson::Value *find_key_path(
    const rapidjson::Value &root, const std::vector<std::string> &key_path)
{
    const rapidjson::Value *current = &root;
    for (const auto &key : key_path) {
        if (!current->IsObject()) {
            return nullptr;
        }

        const rapidjson::Value name{
            rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size()))};
        auto it = current->FindMember(name);
        if (it == current->MemberEnd()) {
            return nullptr;
        }
        current = &it->value;
    }
    return current;
}

} // namespace

validation_errors schema::validate(const rapidjson::Value &record) const
{
    validation_errors errors;
    for (const auto &rule : rules_) {
        const auto *value = find_key_path(record, rule.key_path);
        if (value == nullptr || value->IsNull()) {
            if (rule.required) {
                DOCVAL_DEBUG("Required field '{}' missing from record", rule.field);
                errors.add(rule.field, {"required", "Missing required field"});
            }
            continue;
        }

        if (!value->IsString()) {
            DOCVAL_DEBUG("Field '{}' is not a string", rule.field);
            errors.add(rule.field, {"invalid_type", "Expected a string"});
            continue;
        }

        const std::string_view str{value->GetString(), value->GetStringLength()};
        auto error = tax_id_field_validator{rule.kind}(str);
        if (error.has_value()) {
            DOCVAL_DEBUG("Field '{}' rejected by rule '{}': {}", rule.field, rule.id, error->code);
            errors.add(rule.field, std::move(*error));
        }
    }
    return errors;
}

validation_errors schema::validate(std::string_view json) const
{
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw parsing_error(fmt::format("invalid record: {} at offset {}",
            rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset()));
    }
    return validate(static_cast<const rapidjson::Value &>(doc));
}

} // namespace docval

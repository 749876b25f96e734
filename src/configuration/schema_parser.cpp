// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "configuration/common.hpp"
#include "configuration/schema_diagnostics.hpp"
#include "configuration/schema_parser.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "tax_id.hpp"
#include "validation/schema.hpp"

namespace docval {

namespace {

constexpr unsigned supported_schema_version = 1;

std::optional<tax_id_kind> parse_kind(std::string_view str)
{
    if (str == "any") {
        return std::nullopt;
    }

    auto kind = tax_id_kind_from_string(str);
    if (!kind.has_value()) {
        throw parsing_error(fmt::format("unknown document kind: '{}'", str));
    }
    return kind;
}

field_rule parse_field_rule(const rapidjson::Value &node)
{
    field_rule rule;
    rule.id = at<std::string>(node, "id");
    if (rule.id.empty()) {
        throw parsing_error("empty id");
    }

    rule.field = at<std::string>(node, "field");
    if (rule.field.empty()) {
        throw parsing_error("empty field name");
    }

    rule.key_path = at<std::vector<std::string>>(node, "key_path", {rule.field});
    if (rule.key_path.empty()) {
        throw parsing_error("empty key path");
    }

    rule.kind = parse_kind(at<std::string>(node, "kind", "any"));
    rule.required = at<bool>(node, "required", true);

    return rule;
}

} // namespace

schema parse_schema(const rapidjson::Value &root, schema_diagnostics &diagnostics)
{
    if (!root.IsObject()) {
        throw parsing_error("invalid schema, expected an object");
    }

    auto version = parse_schema_version(root);
    if (version != supported_schema_version) {
        throw parsing_error(fmt::format("unsupported schema version {}", version));
    }

    const auto *fields = find(root, "fields");
    if (fields == nullptr) {
        throw missing_key("fields");
    }
    if (!fields->IsArray()) {
        throw invalid_type("fields", "array");
    }

    std::vector<field_rule> rules;
    std::unordered_set<std::string> ids;
    for (unsigned i = 0; i < fields->Size(); ++i) {
        const auto &node = (*fields)[i];

        std::string id;
        try {
            if (!node.IsObject()) {
                throw parsing_error("invalid field rule, expected an object");
            }

            auto rule = parse_field_rule(node);
            id = rule.id;
            if (ids.contains(id)) {
                DOCVAL_WARN("Duplicate field rule: {}", id);
                diagnostics.add_failed(id, "duplicate field rule");
                continue;
            }

            DOCVAL_DEBUG("Parsed field rule {} on field {}", id, rule.field);
            ids.emplace(id);
            rules.emplace_back(std::move(rule));
            diagnostics.add_loaded(id);
        } catch (const std::exception &e) {
            if (id.empty() && node.IsObject()) {
                const auto *id_node = find(node, "id");
                if (id_node != nullptr && id_node->IsString()) {
                    id = id_node->GetString();
                }
            }
            DOCVAL_WARN("Failed to parse field rule '{}': {}", id, e.what());
            diagnostics.add_failed(i, id, e.what());
        }
    }

    if (rules.empty()) {
        DOCVAL_WARN("No valid field rules found in schema");
    }

    return schema{std::move(rules)};
}

schema parse_schema(std::string_view json, schema_diagnostics &diagnostics)
{
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw parsing_error(fmt::format("invalid schema: {} at offset {}",
            rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset()));
    }

    return parse_schema(static_cast<const rapidjson::Value &>(doc), diagnostics);
}

} // namespace docval

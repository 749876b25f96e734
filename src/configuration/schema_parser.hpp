// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

#include <rapidjson/document.h>

#include "configuration/schema_diagnostics.hpp"
#include "validation/schema.hpp"

namespace docval {

// Invalid field rules are skipped and reported through the diagnostics, while
// a malformed document throws parsing_error.
schema parse_schema(const rapidjson::Value &root, schema_diagnostics &diagnostics);
schema parse_schema(std::string_view json, schema_diagnostics &diagnostics);

} // namespace docval

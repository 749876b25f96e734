// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "validation/validation_error.hpp"

namespace docval {

void validation_errors::add(std::string_view field, validation_error error)
{
    auto it = fields_.find(field);
    if (it == fields_.end()) {
        it = fields_.emplace(std::string{field}, std::vector<validation_error>{}).first;
    }
    it->second.emplace_back(std::move(error));
}

const std::vector<validation_error> &validation_errors::at(std::string_view field) const
{
    static const std::vector<validation_error> no_errors;

    auto it = fields_.find(field);
    if (it == fields_.end()) {
        return no_errors;
    }
    return it->second;
}

} // namespace docval

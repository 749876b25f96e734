// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace docval {

struct validation_error {
    // Machine readable, e.g. invalid_checksum
    std::string code;
    std::string message;
    std::map<std::string, std::string, std::less<>> params{};

    bool operator==(const validation_error &other) const = default;
};

// Errors grouped by the name of the field which produced them
class validation_errors {
public:
    using field_map = std::map<std::string, std::vector<validation_error>, std::less<>>;

    void add(std::string_view field, validation_error error);

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool contains(std::string_view field) const
    {
        return fields_.find(field) != fields_.end();
    }

    // Returns an empty vector if the field has no errors
    [[nodiscard]] const std::vector<validation_error> &at(std::string_view field) const;
    [[nodiscard]] const field_map &fields() const noexcept { return fields_; }

protected:
    field_map fields_;
};

} // namespace docval

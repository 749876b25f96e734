// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

namespace docval {

// Outcome of loading each field rule of a schema
class schema_diagnostics {
public:
    using error_map = std::map<std::string, std::vector<std::string>, std::less<>>;

    void add_loaded(std::string_view id) { loaded_.emplace_back(id); }
    void add_failed(std::string_view id, std::string_view error);
    void add_failed(unsigned index, std::string_view id, std::string_view error)
    {
        if (id.empty()) {
            add_failed(index_to_id(index), error);
        } else {
            add_failed(id, error);
        }
    }

    [[nodiscard]] const std::vector<std::string> &loaded() const noexcept { return loaded_; }
    [[nodiscard]] const std::vector<std::string> &failed() const noexcept { return failed_; }
    // Failed ids grouped by error message
    [[nodiscard]] const error_map &errors() const noexcept { return errors_; }

protected:
    std::vector<std::string> loaded_;
    std::vector<std::string> failed_;
    error_map errors_;
};

} // namespace docval

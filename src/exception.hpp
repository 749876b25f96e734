// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace docval {

class exception : public std::exception {
public:
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    explicit exception(std::string what) : what_(std::move(what)) {}

    std::string what_;
};

class parsing_error : public exception {
public:
    explicit parsing_error(std::string what) : exception(std::move(what)) {}
};

class missing_key : public parsing_error {
public:
    explicit missing_key(std::string_view key)
        : parsing_error("missing key '" + std::string{key} + "'")
    {}
};

class invalid_type : public parsing_error {
public:
    invalid_type(std::string_view key, std::string_view expected)
        : parsing_error(
              "invalid type for key '" + std::string{key} + "', expected " + std::string{expected})
    {}
};

// Raised when an invariant guaranteed by construction does not hold
class internal_error : public exception {
public:
    explicit internal_error(std::string what) : exception(std::move(what)) {}
};

} // namespace docval

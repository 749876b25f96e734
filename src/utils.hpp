// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace docval {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

bool string_iequals(std::string_view left, std::string_view right);

inline std::string index_to_id(unsigned idx) { return "index:" + std::to_string(idx); }

} // namespace docval

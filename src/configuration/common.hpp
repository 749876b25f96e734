// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <rapidjson/document.h>

#include "exception.hpp"

namespace docval {

template <typename T> struct value_traits;

template <> struct value_traits<std::string> {
    static constexpr std::string_view name = "string";
    static bool is(const rapidjson::Value &value) { return value.IsString(); }
    static std::string as(const rapidjson::Value &value)
    {
        return {value.GetString(), value.GetStringLength()};
    }
};

template <> struct value_traits<bool> {
    static constexpr std::string_view name = "boolean";
    static bool is(const rapidjson::Value &value) { return value.IsBool(); }
    static bool as(const rapidjson::Value &value) { return value.GetBool(); }
};

template <> struct value_traits<std::vector<std::string>> {
    static constexpr std::string_view name = "array of strings";
    static bool is(const rapidjson::Value &value)
    {
        if (!value.IsArray()) {
            return false;
        }
        for (const auto &item : value.GetArray()) {
            if (!item.IsString()) {
                return false;
            }
        }
        return true;
    }
    static std::vector<std::string> as(const rapidjson::Value &value)
    {
        std::vector<std::string> output;
        output.reserve(value.Size());
        for (const auto &item : value.GetArray()) {
            output.emplace_back(item.GetString(), item.GetStringLength());
        }
        return output;
    }
};

inline const rapidjson::Value *find(const rapidjson::Value &map, std::string_view key)
{
    const rapidjson::Value name{
        rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size()))};
    auto it = map.FindMember(name);
    return it == map.MemberEnd() ? nullptr : &it->value;
}

template <typename T> T at(const rapidjson::Value &map, std::string_view key)
{
    const auto *value = find(map, key);
    if (value == nullptr) {
        throw missing_key(key);
    }
    if (!value_traits<T>::is(*value)) {
        throw invalid_type(key, value_traits<T>::name);
    }
    return value_traits<T>::as(*value);
}

template <typename T> T at(const rapidjson::Value &map, std::string_view key, const T &default_)
{
    const auto *value = find(map, key);
    if (value == nullptr) {
        return default_;
    }
    if (!value_traits<T>::is(*value)) {
        throw invalid_type(key, value_traits<T>::name);
    }
    return value_traits<T>::as(*value);
}

// Accepts "major" or "major.minor", an absent version defaults to 1
inline unsigned parse_schema_version(const rapidjson::Value &root)
{
    auto version = at<std::string>(root, "version", {});
    if (version.empty()) {
        return 1;
    }

    std::string_view major_str{version};
    auto dot_pos = major_str.find('.');
    if (dot_pos != std::string_view::npos) {
        major_str.remove_suffix(major_str.size() - dot_pos);
    }

    unsigned major = 0;
    const char *data = major_str.data();
    const char *end = data + major_str.size();
    auto [ptr, ec] = std::from_chars(data, end, major);
    if (ec != std::errc{} || ptr != end) {
        throw parsing_error("invalid version format, expected major.minor");
    }

    return major;
}

} // namespace docval

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <format>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace pushscribe::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param what A short description of the document, used in the error message.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input, std::string_view what = "JSON") -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("{} parse error: {}", what, e.what()));
    }
}

/// @brief Returns a pointer to the named member if it is an object, nullptr otherwise.
[[nodiscard]] inline auto findObject(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(key);
    if (it == obj.end() || !it->is_object())
        return nullptr;
    return &*it;
}

/// @brief Returns a pointer to the named member if it is an array, nullptr otherwise.
[[nodiscard]] inline auto findArray(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(key);
    if (it == obj.end() || !it->is_array())
        return nullptr;
    return &*it;
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    if (obj.is_object())
    {
        auto const it = obj.find(key);
        if (it != obj.end() && it->is_string())
            return it->get<std::string>();
    }
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    if (obj.is_object())
    {
        auto const it = obj.find(key);
        if (it != obj.end() && it->is_number_integer())
            return it->get<int>();
    }
    return defaultValue;
}

/// @brief Extracts an optional float field from a JSON object. Integers are accepted.
[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    if (obj.is_object())
    {
        auto const it = obj.find(key);
        if (it != obj.end() && it->is_number())
            return it->get<float>();
    }
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    if (obj.is_object())
    {
        auto const it = obj.find(key);
        if (it != obj.end() && it->is_boolean())
            return it->get<bool>();
    }
    return defaultValue;
}

} // namespace pushscribe::json

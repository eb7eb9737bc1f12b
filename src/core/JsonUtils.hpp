// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace voicescribe::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the named sub-object, or an empty object if it is missing or not an object.
[[nodiscard]] inline auto section(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_object())
        return obj[keyStr];
    return nlohmann::json::object();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional non-negative 64-bit integer field (byte counts, milliseconds).
///
/// Negative values are treated as missing.
[[nodiscard]] inline auto getUInt64Or(const nlohmann::json& obj, std::string_view key, std::uint64_t defaultValue)
    -> std::uint64_t
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer() && obj[keyStr].get<std::int64_t>() >= 0)
        return obj[keyStr].get<std::uint64_t>();
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
///
/// Integer literals are accepted too, so `"graceSeconds": 2` reads as 2.0.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts a string-to-string map; entries whose value is not a string are skipped.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    auto keyStr = std::string(key);
    if (!obj.contains(keyStr) || !obj[keyStr].is_object())
        return result;

    for (auto const& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            result[name] = value.get<std::string>();
    }
    return result;
}

} // namespace voicescribe::json

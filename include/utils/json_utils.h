// json_utils.h - helpers for safe JSON parsing and serialization
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace sagegate {

// Parse JSON string; returns std::nullopt on error and fills error message if provided.
std::optional<nlohmann::json> parse_json(std::string_view body, std::string* error = nullptr);

// Get value if present and convertible; otherwise fallback is returned.
template <typename T>
T get_or(const nlohmann::json& j, const std::string& key, const T& fallback) {
    if (!j.is_object() || !j.contains(key)) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

// Compact JSON to string. Invalid UTF-8 in strings is replaced with U+FFFD
// instead of throwing.
std::string json_to_string(const nlohmann::json& j);

}  // namespace sagegate

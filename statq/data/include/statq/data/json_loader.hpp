#pragma once

#include <statq/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statq::data {

// ============================================================================
// LoadResult - Outcome of deserializing one JSON array section
// ============================================================================

template<typename T>
struct LoadResult {
    std::vector<T> items;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    size_t total_processed = 0;

    bool success() const { return errors.empty(); }
    size_t loaded_count() const { return items.size(); }
    size_t error_count() const { return errors.size(); }
};

// ============================================================================
// Parsing
// ============================================================================

// Parse JSON text; source_name only labels log output
inline std::optional<nlohmann::json> parse_json_text(const std::string& text,
                                                     const std::string& source_name = "<memory>") {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        core::log(core::LogLevel::Error, "[JsonLoader] Parse error in {}: {}", source_name, e.what());
        return std::nullopt;
    }
}

// Load and parse a JSON file, nullopt when it cannot be opened or parsed
inline std::optional<nlohmann::json> load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log(core::LogLevel::Error, "[JsonLoader] Failed to open file: {}", path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        core::log(core::LogLevel::Error, "[JsonLoader] Parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// load_json_array - Deserialize every object of an array section
// ============================================================================

// Deserializer signature:
//   std::optional<T> deserialize(const nlohmann::json& obj, std::string& out_error)
// A nullopt return records out_error against the item index.
//
// array_key empty means the root itself is the array. When required is false a
// missing key yields an empty, successful result.
template<typename T, typename Deserializer>
LoadResult<T> load_json_array(const nlohmann::json& root,
                              Deserializer deserialize_fn,
                              const std::string& array_key = "",
                              bool required = true) {
    LoadResult<T> result;

    const nlohmann::json* arr = &root;
    if (!array_key.empty()) {
        if (!root.is_object() || !root.contains(array_key)) {
            if (required) {
                result.errors.push_back("Missing key '" + array_key + "' in JSON");
            }
            return result;
        }
        arr = &root[array_key];
    }

    if (!arr->is_array()) {
        result.errors.push_back(array_key.empty()
            ? std::string("Expected root to be an array")
            : "Key '" + array_key + "' is not an array");
        return result;
    }

    result.items.reserve(arr->size());
    size_t index = 0;
    for (const auto& item : *arr) {
        ++result.total_processed;

        if (!item.is_object()) {
            result.warnings.push_back("Item at index " + std::to_string(index) + " is not an object, skipping");
            ++index;
            continue;
        }

        std::string error;
        auto obj_opt = deserialize_fn(item, error);
        if (obj_opt) {
            result.items.push_back(std::move(*obj_opt));
        } else {
            result.errors.push_back("Item " + std::to_string(index) + ": " + error);
        }
        ++index;
    }

    return result;
}

// File variant: a file that cannot be loaded is a single error
template<typename T, typename Deserializer>
LoadResult<T> load_json_array_file(const std::string& path,
                                   Deserializer deserialize_fn,
                                   const std::string& array_key = "") {
    auto json_opt = load_json_file(path);
    if (!json_opt) {
        LoadResult<T> result;
        result.errors.push_back("Failed to load or parse file: " + path);
        return result;
    }
    return load_json_array<T>(*json_opt, deserialize_fn, array_key);
}

// ============================================================================
// JSON Value Helpers - Safe extraction with defaults
// ============================================================================

namespace json_helpers {

inline std::string get_string(const nlohmann::json& j, const std::string& key, const std::string& def = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return def;
}

inline int get_int(const nlohmann::json& j, const std::string& key, int def = 0) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int>();
    }
    return def;
}

inline double get_double(const nlohmann::json& j, const std::string& key, double def = 0.0) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return def;
}

inline bool get_bool(const nlohmann::json& j, const std::string& key, bool def = false) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return def;
}

// Numbers and booleans (true = 1) as double, nullopt when absent or of another type
inline std::optional<double> get_optional_number(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return std::nullopt;
    const auto& v = j[key];
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_number()) return v.get<double>();
    return std::nullopt;
}

inline std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

inline bool require_string(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!j[key].is_string()) {
        out_error = "Field '" + key + "' must be a string";
        return false;
    }
    return true;
}

inline bool require_int(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!j[key].is_number_integer()) {
        out_error = "Field '" + key + "' must be an integer";
        return false;
    }
    return true;
}

} // namespace json_helpers

} // namespace statq::data

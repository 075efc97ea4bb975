#pragma once

#include <stash/core/log.hpp>
#include <stash/core/math.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace stash::data {

// ============================================================================
// LoadResult - Result of a JSON loading operation
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
// JSON Loading Utilities
// ============================================================================

// Load and parse a JSON file. Returns nullopt on failure.
inline std::optional<nlohmann::json> load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log_error("json", "Failed to open file: {}", path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        core::log_error("json", "Parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// parse_json_array - Deserialize an array of objects
// ============================================================================

// Deserializer signature:
// std::optional<T> deserialize(const nlohmann::json& obj, std::string& out_error)
// - std::nullopt on failure, with the reason in out_error

template<typename T, typename Deserializer>
LoadResult<T> parse_json_array(
    const nlohmann::json& root,
    Deserializer deserialize_fn,
    const std::string& array_key = ""  // Empty = root is array
) {
    LoadResult<T> result;

    const nlohmann::json* arr = nullptr;
    if (array_key.empty()) {
        if (!root.is_array()) {
            result.errors.push_back("Expected root to be an array");
            return result;
        }
        arr = &root;
    } else {
        if (!root.is_object() || !root.contains(array_key)) {
            result.errors.push_back("Missing key '" + array_key + "' in JSON");
            return result;
        }
        if (!root[array_key].is_array()) {
            result.errors.push_back("Key '" + array_key + "' is not an array");
            return result;
        }
        arr = &root[array_key];
    }

    result.items.reserve(arr->size());
    size_t index = 0;

    for (const auto& entry : *arr) {
        ++result.total_processed;

        if (!entry.is_object()) {
            result.warnings.push_back("Entry at index " + std::to_string(index) + " is not an object, skipping");
            ++index;
            continue;
        }

        std::string error;
        auto obj_opt = deserialize_fn(entry, error);

        if (obj_opt) {
            result.items.push_back(std::move(*obj_opt));
        } else {
            result.errors.push_back("Entry " + std::to_string(index) + ": " + error);
        }

        ++index;
    }

    return result;
}

template<typename T, typename Deserializer>
LoadResult<T> load_json_array(
    const std::string& path,
    Deserializer deserialize_fn,
    const std::string& array_key = ""
) {
    auto json_opt = load_json_file(path);
    if (!json_opt) {
        LoadResult<T> result;
        result.errors.push_back("Failed to load or parse file: " + path);
        return result;
    }
    return parse_json_array<T>(*json_opt, deserialize_fn, array_key);
}

// Log the warnings and errors collected by a load
template<typename T>
void log_load_result(const LoadResult<T>& result, const std::string& source, const std::string& category) {
    for (const auto& warn : result.warnings) {
        core::log_warning(category, "{}", warn);
    }
    for (const auto& err : result.errors) {
        core::log_error(category, "{}", err);
    }
    core::log_info(category, "Loaded {} entries from {} ({} errors)",
                   result.loaded_count(), source, result.error_count());
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

// Integer value that fits in an int; nullopt for floats, non-numbers and
// out-of-range integers
inline std::optional<int> to_int(const nlohmann::json& value) {
    constexpr auto min = std::numeric_limits<int>::min();
    constexpr auto max = std::numeric_limits<int>::max();

    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(max)) return std::nullopt;
        return static_cast<int>(u);
    }
    if (value.is_number_integer()) {
        auto i = value.get<int64_t>();
        if (i < min || i > max) return std::nullopt;
        return static_cast<int>(i);
    }
    return std::nullopt;
}

inline int get_int(const nlohmann::json& j, const std::string& key, int def = 0) {
    if (!j.contains(key)) return def;
    return to_int(j[key]).value_or(def);
}

inline std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& entry : j[key]) {
            if (entry.is_string()) {
                result.push_back(entry.get<std::string>());
            }
        }
    }
    return result;
}

// Reads a two-element integer array such as "size": [2, 3]
inline std::optional<core::IVec2> get_ivec2(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return std::nullopt;

    const auto& value = j[key];
    if (!value.is_array() || value.size() != 2) return std::nullopt;

    auto x = to_int(value[0]);
    auto y = to_int(value[1]);
    if (!x || !y) return std::nullopt;
    return core::IVec2(*x, *y);
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

inline bool require_ivec2(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!get_ivec2(j, key)) {
        out_error = "Field '" + key + "' must be an array of two int-sized integers";
        return false;
    }
    return true;
}

} // namespace json_helpers

} // namespace stash::data

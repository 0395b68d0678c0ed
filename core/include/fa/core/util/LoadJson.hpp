// LoadJson.hpp - reading and checking the JSON documents that drive rendering
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>
#include <initializer_list>

namespace fa::json {

// Parses a whole file. Throws std::runtime_error if it is missing or not JSON.
nlohmann::json load_json_file(const std::filesystem::path& path);

/**
 * Check that a config section is an object carrying every listed key.
 * @param json Section to check
 * @param fields Keys that must be present
 * @param context Prefix for the error message, e.g. "indicator 'NBP'"
 * @throws std::runtime_error naming the first absent key
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// Throws unless json[field] exists and is a non-empty array.
void require_array(
    const nlohmann::json& json,
    const char* field,
    const std::string& context);

// m[key] as a number (numeric strings included); def when absent or unusable.
double number_or(const nlohmann::json* m, const char* key, double def);

// m[key] when it is a string, def otherwise.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

} // namespace fa::json

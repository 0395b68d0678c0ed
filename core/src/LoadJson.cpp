#include "fa/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace fa::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    if (!json.is_object()) {
        throw std::runtime_error(context + " must be a JSON object");
    }
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw std::runtime_error(context + " missing required field: " + field);
        }
    }
}

void require_array(
    const nlohmann::json& json,
    const char* field,
    const std::string& context)
{
    require_fields(json, {field}, context);
    const auto& value = json[field];
    if (!value.is_array()) {
        throw std::runtime_error(context + " field '" + std::string(field) + "' must be an array");
    }
    if (value.empty()) {
        throw std::runtime_error(context + " field '" + std::string(field) + "' must not be empty");
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

} // namespace fa::json

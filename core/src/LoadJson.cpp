#include "folio/core/util/LoadJson.hpp"

#include "folio/core/util/Errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace folio::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw Error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw Error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw Error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

long long integer_or(const nlohmann::json& m, const char* key, long long def, const std::string& context)
{
    if (!m.is_object()) return def;
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_number_integer()) {
        throw Error(context + " field '" + std::string(key) + "' must be an integer");
    }
    return it->get<long long>();
}

double number_or(const nlohmann::json& m, const char* key, double def, const std::string& context)
{
    if (!m.is_object()) return def;
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<long long>());
    throw Error(context + " field '" + std::string(key) + "' must be a number");
}

} // namespace folio::json

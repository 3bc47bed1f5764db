// LoadJson.hpp - JSON loading helpers for Folio
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>

namespace folio::json {

// Throws folio::Error if the file is missing, unreadable or not valid JSON
nlohmann::json load_json_file(const std::filesystem::path& path);

// Returns an integer if present, else def. Throws folio::Error on a non-integer value.
long long integer_or(const nlohmann::json& m, const char* key, long long def, const std::string& context);

// Returns a number if present (float or integer), else def. Throws folio::Error on a non-number.
double number_or(const nlohmann::json& m, const char* key, double def, const std::string& context);

} // namespace folio::json

// LoadJson.hpp - JSON loading and validation utilities
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>
#include <initializer_list>

namespace ss::json {

nlohmann::json load_json_file(const std::filesystem::path& path);

// Parse an in-memory document; `context` names its origin in error messages.
nlohmann::json parse_json(const std::string& text, const std::string& context);

// ============ VALIDATION ============

/**
 * Ensure all required fields exist in a JSON object.
 * @param json The JSON object to validate
 * @param fields List of required field names
 * @param context Description for error messages (e.g., file path or URL)
 * @throws std::runtime_error listing the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

/**
 * Read a numeric field, accepting numbers and numeric strings.
 * @throws std::runtime_error if missing or not numeric
 */
double require_number(
    const nlohmann::json& json,
    const char* field,
    const std::string& context);

} // namespace ss::json

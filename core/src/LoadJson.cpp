#include "ss/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace ss::json {

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

nlohmann::json parse_json(const std::string& text, const std::string& context)
{
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON from " + context + ": " + e.what());
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    if (!json.is_object()) {
        throw std::runtime_error(context + " is not a JSON object");
    }
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw std::runtime_error(context + " missing required field: " + field);
        }
    }
}

static std::optional<double> as_number(const nlohmann::json& v)
{
    if (v.is_number_float())   return v.get<double>();
    if (v.is_number_integer()) return static_cast<double>(v.get<int64_t>());
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        try {
            size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size()) return d;
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

double require_number(
    const nlohmann::json& json,
    const char* field,
    const std::string& context)
{
    require_fields(json, {field}, context);
    auto v = as_number(json[field]);
    if (!v) {
        throw std::runtime_error(context + " field '" + std::string(field) + "' is not a number");
    }
    return *v;
}

} // namespace ss::json

#include "ss/core/util/SyncConfig.hpp"

#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "ss/core/util/Errors.hpp"
#include "ss/core/util/LoadJson.hpp"
#include "ss/core/util/Logging.hpp"

namespace ss {

namespace {

// A JSON integer that fits in T; anything else is an InvalidArgument.
template <typename T>
T integer_or(const nlohmann::json& j, const char* key, T def)
{
    if (!j.contains(key))
        return def;

    const auto& v = j[key];
    if (!v.is_number_integer())
        throw InvalidArgument(std::string(key) + " must be an integer, got " + v.dump());

    constexpr auto lo = static_cast<int64_t>(std::numeric_limits<T>::min());
    constexpr auto hi = static_cast<uint64_t>(std::numeric_limits<T>::max());
    bool in_range;
    if (v.is_number_unsigned()) {
        in_range = v.get<uint64_t>() <= hi;
    } else {
        const auto n = v.get<int64_t>();
        in_range = n >= lo && (n < 0 || static_cast<uint64_t>(n) <= hi);
    }
    if (!in_range)
        throw InvalidArgument(std::string(key) + " is out of range: " + v.dump());
    return v.is_number_unsigned() ? static_cast<T>(v.get<uint64_t>()) : static_cast<T>(v.get<int64_t>());
}

} // namespace

SyncOptions SyncConfig::options() const
{
    SyncOptions o;
    o.downsampleRef = downsampleRef;
    o.downsampleImg = downsampleImg;
    o.detectionXY = detectionXY;
    o.includeExpression = includeExpression;
    return o;
}

SyncConfig parseSyncConfig(const nlohmann::json& j)
{
    if (!j.is_object())
        throw InvalidArgument("sync config must be a JSON object");

    SyncConfig c;
    try {
        c.apiBaseUrl = j.value("api_base_url", c.apiBaseUrl);
        c.downsampleRef = integer_or(j, "downsample_ref", c.downsampleRef);
        c.downsampleImg = integer_or(j, "downsample_img", c.downsampleImg);
        c.includeExpression = j.value("include_expression", c.includeExpression);
        c.httpTimeoutSeconds = integer_or(j, "http_timeout_s", c.httpTimeoutSeconds);
        c.logLevel = j.value("log_level", c.logLevel);
        c.logFile = j.value("log_file", c.logFile);

        if (j.contains("detection_xy")) {
            const auto& xy = j["detection_xy"];
            if (!xy.is_array() || xy.size() != 2)
                throw InvalidArgument("detection_xy must be an array [x, y]");
            c.detectionXY = {xy[0].get<double>(), xy[1].get<double>()};
        }
    } catch (const nlohmann::json::type_error& e) {
        throw InvalidArgument(std::string("sync config: ") + e.what());
    }

    if (c.downsampleRef < 1)
        throw InvalidArgument("downsample_ref must be >= 1, got " + std::to_string(c.downsampleRef));
    if (c.downsampleImg < 0)
        throw InvalidArgument("downsample_img must be >= 0, got " + std::to_string(c.downsampleImg));
    if (c.httpTimeoutSeconds < 0)
        throw InvalidArgument("http_timeout_s must be >= 0");
    if (c.apiBaseUrl.empty())
        throw InvalidArgument("api_base_url must not be empty");
    ParseLogLevel(c.logLevel);  // throws on an unknown level

    return c;
}

nlohmann::json toJson(const SyncConfig& c)
{
    nlohmann::json j;
    j["api_base_url"] = c.apiBaseUrl;
    j["downsample_ref"] = c.downsampleRef;
    j["downsample_img"] = c.downsampleImg;
    j["detection_xy"] = {c.detectionXY.x, c.detectionXY.y};
    j["include_expression"] = c.includeExpression;
    j["http_timeout_s"] = c.httpTimeoutSeconds;
    j["log_level"] = c.logLevel;
    if (!c.logFile.empty())
        j["log_file"] = c.logFile;
    return j;
}

SyncConfig loadSyncConfig(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
        return {};

    const auto j = json::load_json_file(path);
    try {
        return parseSyncConfig(j);
    } catch (const InvalidArgument& e) {
        throw InvalidArgument(path.string() + ": " + e.what());
    }
}

void applyLogging(const SyncConfig& c)
{
    SetLogLevel(c.logLevel);
    if (!c.logFile.empty())
        AddLogFile(c.logFile);
}

} // namespace ss

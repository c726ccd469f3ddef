#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "ss/core/atlas/AllenApi.hpp"
#include "ss/core/sync/DatasetSync.hpp"

namespace ss {

// Settings for a dataset sync against the Allen API, usually read from a
// JSON file. Every key is optional.
struct SyncConfig {
    std::string apiBaseUrl = allen::kDefaultBaseUrl;  // "api_base_url"
    int downsampleRef = 25;                           // "downsample_ref"
    int downsampleImg = 0;                            // "downsample_img"
    cv::Point2d detectionXY{0, 0};                    // "detection_xy": [x, y]
    bool includeExpression = false;                   // "include_expression"
    long httpTimeoutSeconds = 0;                      // "http_timeout_s", 0 = none
    std::string logLevel = "info";                    // "log_level"
    std::string logFile;                              // "log_file", empty = stdout only

    [[nodiscard]] SyncOptions options() const;
};

// Throws ss::InvalidArgument for out-of-range values or wrongly typed keys.
SyncConfig parseSyncConfig(const nlohmann::json& j);
nlohmann::json toJson(const SyncConfig& c);

// Returns defaults when `path` does not exist.
SyncConfig loadSyncConfig(const std::filesystem::path& path);

// Apply log_level and log_file to the process-wide logger.
void applyLogging(const SyncConfig& c);

} // namespace ss

/**
 * @file WatchConfig.hpp
 * @brief Snapshot of the parameters a WatchSession runs with.
 */

#pragma once

#include <algorithm>
#include <set>
#include <string>

namespace steamcorder::domain {

constexpr int kMinUploadDelaySeconds = 0;
constexpr int kMaxUploadDelaySeconds = 30;

/** @brief Extensions accepted when none are configured explicitly. */
inline std::set<std::string> DefaultAllowedExtensions() {
    return {".png", ".jpg", ".jpeg", ".gif", ".bmp"};
}

inline int ClampUploadDelay(int seconds) {
    return std::clamp(seconds, kMinUploadDelaySeconds, kMaxUploadDelaySeconds);
}

/**
 * @struct WatchConfig
 * @brief Directory, webhook target and pipeline options for one monitoring run.
 *
 * Handed to WatchSession::Start() by value. Only uploadDelaySeconds and
 * deleteAfterUpload can change afterwards, through the session's update calls.
 */
struct WatchConfig {
    std::string directory;       ///< Directory watched non-recursively.
    std::string webhookUrl;      ///< Full URL the files are POSTed to.
    int uploadDelaySeconds = 0;  ///< Fixed wait between stability and upload.
    bool deleteAfterUpload = false;
    std::set<std::string> allowedExtensions = DefaultAllowedExtensions(); ///< Lowercase, with leading dot.
};

} // namespace steamcorder::domain

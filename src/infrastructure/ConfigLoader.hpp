/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application settings (config.json).
 *
 * The monitoring core never touches this file; the UI loads settings here and
 * hands a WatchConfig snapshot to the session.
 */

#pragma once

#include <filesystem>
#include <string>

#include "domain/WatchConfig.hpp"

namespace steamcorder::infrastructure {

/**
 * @struct AppSettings
 * @brief Everything persisted between runs.
 */
struct AppSettings {
    std::string watchDirectory;    ///< "watch_directory"
    std::string webhookUrl;        ///< "webhook_url"
    int uploadDelaySeconds = 2;    ///< "upload_delay"
    bool deleteAfterUpload = false;///< "delete_after_upload"
    bool webhookHidden = false;    ///< "webhook_hidden": mask the URL in the UI.
    bool monitoringActive = false; ///< "monitoring_active": resume on next launch.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     *
     * Missing file or unparsable JSON yields defaults. Keys are read one by one,
     * so a key with the wrong type falls back to its default alone.
     */
    static AppSettings Load(const std::filesystem::path& configPath);

    /**
     * @brief Writes settings, preserving unrelated keys already in the file.
     * @return False if the file could not be written.
     */
    static bool Save(const std::filesystem::path& configPath, const AppSettings& settings);

    /** @brief Builds the session snapshot (default extensions, clamped delay). */
    static domain::WatchConfig ToWatchConfig(const AppSettings& settings);
};

} // namespace steamcorder::infrastructure

/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace steamcorder::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) {
        return;
    }
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

AppSettings ConfigLoader::Load(const std::filesystem::path& configPath) {
    AppSettings settings;
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object, using defaults." << std::endl;
        return settings;
    }

    ReadKey(j, "watch_directory", settings.watchDirectory);
    ReadKey(j, "webhook_url", settings.webhookUrl);
    ReadKey(j, "upload_delay", settings.uploadDelaySeconds);
    ReadKey(j, "delete_after_upload", settings.deleteAfterUpload);
    ReadKey(j, "webhook_hidden", settings.webhookHidden);
    ReadKey(j, "monitoring_active", settings.monitoringActive);
    settings.uploadDelaySeconds = domain::ClampUploadDelay(settings.uploadDelaySeconds);
    return settings;
}

bool ConfigLoader::Save(const std::filesystem::path& configPath, const AppSettings& settings) {
    nlohmann::json j = nlohmann::json::object();
    std::error_code ec;

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath, ec)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception&) {
            j = nlohmann::json::object();
        }
    }

    j["watch_directory"] = settings.watchDirectory;
    j["webhook_url"] = settings.webhookUrl;
    j["upload_delay"] = domain::ClampUploadDelay(settings.uploadDelaySeconds);
    j["delete_after_upload"] = settings.deleteAfterUpload;
    j["webhook_hidden"] = settings.webhookHidden;
    j["monitoring_active"] = settings.monitoringActive;

    if (configPath.has_parent_path()) {
        std::filesystem::create_directories(configPath.parent_path(), ec);
    }

    std::ofstream f(configPath, std::ios::trunc);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

domain::WatchConfig ConfigLoader::ToWatchConfig(const AppSettings& settings) {
    domain::WatchConfig config;
    config.directory = settings.watchDirectory;
    config.webhookUrl = settings.webhookUrl;
    config.uploadDelaySeconds = domain::ClampUploadDelay(settings.uploadDelaySeconds);
    config.deleteAfterUpload = settings.deleteAfterUpload;
    config.allowedExtensions = domain::DefaultAllowedExtensions();
    return config;
}

} // namespace steamcorder::infrastructure

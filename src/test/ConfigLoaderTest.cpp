#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

namespace fs = std::filesystem;
using steamcorder::infrastructure::AppSettings;
using steamcorder::infrastructure::ConfigLoader;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / "steamcorder_config_test";
    fs::remove_all(root);
    fs::path configPath = root / "nested" / "config.json";

    // Missing file
    {
        AppSettings settings = ConfigLoader::Load(configPath);
        assert(settings.watchDirectory.empty());
        assert(settings.webhookUrl.empty());
        assert(settings.uploadDelaySeconds == 2);
        assert(!settings.deleteAfterUpload);
        assert(!settings.webhookHidden);
        assert(!settings.monitoringActive);
    }

    // Save creates the parent directory and keeps keys written by others.
    {
        fs::create_directories(configPath.parent_path());
        {
            std::ofstream out(configPath);
            out << R"({"minimize_on_exit": true, "upload_delay": 5})";
        }

        AppSettings settings;
        settings.watchDirectory = "/home/player/screenshots";
        settings.webhookUrl = "https://discord.com/api/webhooks/1/token";
        settings.uploadDelaySeconds = 45;
        settings.deleteAfterUpload = true;
        settings.webhookHidden = true;
        settings.monitoringActive = true;
        assert(ConfigLoader::Save(configPath, settings));

        AppSettings loaded = ConfigLoader::Load(configPath);
        assert(loaded.watchDirectory == "/home/player/screenshots");
        assert(loaded.webhookUrl == "https://discord.com/api/webhooks/1/token");
        assert(loaded.uploadDelaySeconds == 30);
        assert(loaded.deleteAfterUpload);
        assert(loaded.webhookHidden);
        assert(loaded.monitoringActive);

        std::ifstream in(configPath);
        nlohmann::json j;
        in >> j;
        assert(j["minimize_on_exit"].get<bool>());
        assert(j["upload_delay"].get<int>() == 30);
    }

    // A key with the wrong type falls back alone.
    {
        {
            std::ofstream out(configPath, std::ios::trunc);
            out << R"({"webhook_url": 42, "watch_directory": "/tmp/shots", "delete_after_upload": true})";
        }
        AppSettings loaded = ConfigLoader::Load(configPath);
        assert(loaded.webhookUrl.empty());
        assert(loaded.watchDirectory == "/tmp/shots");
        assert(loaded.deleteAfterUpload);
    }

    // Corrupt file
    {
        {
            std::ofstream out(configPath, std::ios::trunc);
            out << "{ not json";
        }
        AppSettings loaded = ConfigLoader::Load(configPath);
        assert(loaded.watchDirectory.empty());
        assert(loaded.uploadDelaySeconds == 2);
    }

    // Snapshot handed to the session
    {
        AppSettings settings;
        settings.watchDirectory = "/shots";
        settings.webhookUrl = "http://localhost/hook";
        settings.uploadDelaySeconds = -3;
        settings.deleteAfterUpload = true;
        auto config = ConfigLoader::ToWatchConfig(settings);
        assert(config.directory == "/shots");
        assert(config.webhookUrl == "http://localhost/hook");
        assert(config.uploadDelaySeconds == 0);
        assert(config.deleteAfterUpload);
        assert(config.allowedExtensions.size() == 5);
        assert(config.allowedExtensions.count(".jpeg") == 1);
    }

    fs::remove_all(root);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}

// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace steamcorder::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    /** @brief $XDG_CONFIG_HOME/Steamcorder, created on demand. */
    static std::filesystem::path GetAppConfigDir();
    static std::filesystem::path GetSettingsPath();
};

} // namespace steamcorder::infrastructure

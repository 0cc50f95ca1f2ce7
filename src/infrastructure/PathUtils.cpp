#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace steamcorder::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetAppConfigDir() {
    fs::path base = GetConfigHome() / "Steamcorder";
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        fs::create_directories(base, ec);
        if (ec) {
            std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
        }
    }
    return base;
}

fs::path PathUtils::GetSettingsPath() {
    return GetAppConfigDir() / "config.json";
}

} // namespace steamcorder::infrastructure

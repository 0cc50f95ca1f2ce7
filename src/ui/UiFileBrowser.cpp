#include "ui/UiFileBrowser.hpp"
#include "domain/WatchConfig.hpp"
#include "imgui.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace steamcorder::ui {

namespace fs = std::filesystem;

namespace {

fs::path ResolveBrowsePath(const char* buffer, const std::string& fallbackRoot) {
    std::error_code ec;
    fs::path current;
    if (buffer && buffer[0] != '\0') {
        current = fs::path(buffer);
    } else if (!fallbackRoot.empty()) {
        current = fs::path(fallbackRoot);
    }

    if (!current.empty() && (!fs::exists(current, ec) || !fs::is_directory(current, ec))) {
        current = current.parent_path();
    }
    if (current.empty() || !fs::is_directory(current, ec)) {
        current = fs::current_path(ec);
    }
    return current;
}

std::vector<std::pair<std::string, fs::path>> GetShortcuts() {
    std::vector<std::pair<std::string, fs::path>> shortcuts;
    std::error_code ec;

    const char* home = std::getenv("HOME");
    if (home && *home) {
        fs::path homePath(home);
        shortcuts.emplace_back("Home", homePath);
        if (fs::is_directory(homePath / "Pictures", ec)) {
            shortcuts.emplace_back("Pictures", homePath / "Pictures");
        }
        // Steam keeps per-user screenshot folders below userdata/<id>/760/remote.
        const fs::path steamCandidates[] = {
            homePath / ".local" / "share" / "Steam" / "userdata",
            homePath / ".steam" / "steam" / "userdata",
        };
        for (const auto& candidate : steamCandidates) {
            if (fs::is_directory(candidate, ec)) {
                shortcuts.emplace_back("Steam userdata", candidate);
                break;
            }
        }
    }
    shortcuts.emplace_back("/", fs::path("/"));
    return shortcuts;
}

int CountSupportedImages(const fs::path& folder) {
    static const auto extensions = domain::DefaultAllowedExtensions();
    int count = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(folder, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
        if (extensions.count(ext)) ++count;
    }
    return count;
}

} // namespace

void SetPathBuffer(char* buffer, size_t bufferSize, const fs::path& path) {
    if (!buffer || bufferSize == 0) {
        return;
    }
    std::string value = path.string();
    std::snprintf(buffer, bufferSize, "%s", value.c_str());
}

bool DrawFolderBrowser(const char* id, char* pathBuffer, size_t bufferSize, const std::string& fallbackRoot) {
    ImGui::PushID(id);

    fs::path current = ResolveBrowsePath(pathBuffer, fallbackRoot);
    bool updated = false;

    ImGui::Text("Location:");
    ImGui::SameLine();
    ImGui::TextUnformatted(current.string().c_str());
    ImGui::TextDisabled("%d supported image(s) in this folder", CountSupportedImages(current));

    if (ImGui::Button("Up") && current.has_parent_path()) {
        current = current.parent_path();
        updated = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Use This Folder")) {
        updated = true;
    }

    ImGui::Separator();
    for (const auto& [label, path] : GetShortcuts()) {
        if (ImGui::SmallButton(label.c_str())) {
            current = path;
            updated = true;
        }
        ImGui::SameLine();
    }
    ImGui::NewLine();

    if (ImGui::BeginChild("FolderList", ImVec2(0, 200), true)) {
        std::error_code ec;
        std::vector<fs::path> folders;
        for (const auto& entry : fs::directory_iterator(current, ec)) {
            if (entry.is_directory(ec)) {
                folders.push_back(entry.path());
            }
        }
        if (ec) {
            ImGui::TextDisabled("Could not read folder.");
        } else {
            std::sort(folders.begin(), folders.end(), [](const fs::path& a, const fs::path& b) {
                return a.filename().string() < b.filename().string();
            });
            for (const auto& folder : folders) {
                std::string name = folder.filename().string();
                if (ImGui::Selectable(name.empty() ? folder.string().c_str() : name.c_str())) {
                    current = folder;
                    updated = true;
                }
            }
        }
    }
    ImGui::EndChild();

    if (updated) {
        SetPathBuffer(pathBuffer, bufferSize, current);
    }

    ImGui::PopID();
    return updated;
}

} // namespace steamcorder::ui

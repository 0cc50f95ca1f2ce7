#include "ui/panels/MainPanels.hpp"
#include "ui/UiFileBrowser.hpp"
#include "imgui.h"
#include <cstdlib>
#include <string>

namespace steamcorder::ui {

void DrawHowToModal(AppState& app) {
    if (app.ui.showHowTo) {
        ImGui::OpenPopup("How to Use Steamcorder");
    }

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (ImGui::BeginPopupModal("How to Use Steamcorder", &app.ui.showHowTo, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::TextUnformatted(
            "1. Select your Steam screenshot folder (enable 'Save an uncompressed copy of screenshot' in Steam).\n"
            "2. Get a Discord webhook URL from your channel/server.\n"
            "3. Enter the webhook URL and adjust the delay if needed.\n"
            "4. Press Start to begin monitoring.");
        ImGui::Spacing();
        ImGui::TextDisabled("Supported files: .png .jpg .jpeg .gif .bmp");
        if (ImGui::Button("Close", ImVec2(120, 0))) {
            app.ui.showHowTo = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void DrawFolderBrowserModal(AppState& app) {
    if (app.form.showFolderBrowser) {
        ImGui::OpenPopup("Select Folder");
    }

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(600, 420), ImGuiCond_FirstUseEver);

    if (ImGui::BeginPopupModal("Select Folder", &app.form.showFolderBrowser)) {
        const char* home = std::getenv("HOME");
        DrawFolderBrowser("WatchFolder", app.form.folderBuffer, sizeof(app.form.folderBuffer),
                          home ? std::string(home) : std::string());
        ImGui::Separator();
        if (ImGui::Button("OK", ImVec2(120, 0))) {
            app.form.showFolderBrowser = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void DrawAllModals(AppState& app) {
    DrawHowToModal(app);
    DrawFolderBrowserModal(app);
}

} // namespace steamcorder::ui

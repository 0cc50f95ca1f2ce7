#include "ui/panels/MainPanels.hpp"
#include "imgui.h"

namespace steamcorder::ui {

void DrawMenuBar(AppState& app) {
    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            const bool monitoring = app.IsMonitoring();
            if (ImGui::MenuItem(monitoring ? "Stop Monitoring" : "Start Monitoring")) {
                app.ToggleMonitoring();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Quit")) {
                app.ui.requestExit = true;
            }
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("Help")) {
            if (ImGui::MenuItem("How to Use")) {
                app.ui.showHowTo = true;
            }
            ImGui::EndMenu();
        }
        ImGui::EndMenuBar();
    }
}

} // namespace steamcorder::ui

#include "ui/panels/MainPanels.hpp"
#include "imgui.h"

namespace steamcorder::ui {

void DrawMainTabs(AppState& app) {
    if (ImGui::BeginTabBar("MainTabs")) {
        DrawDashboardTab(app);
        DrawSettingsTab(app);
        ImGui::EndTabBar();
    }
}

void DrawMainWindow(AppState& app) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGui::Begin("Main", NULL, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_MenuBar);

    DrawMenuBar(app);
    DrawMainTabs(app);

    ImGui::End();
}

} // namespace steamcorder::ui

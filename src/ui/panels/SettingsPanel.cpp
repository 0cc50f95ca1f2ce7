#include "ui/panels/MainPanels.hpp"
#include "domain/WatchConfig.hpp"
#include "imgui.h"

namespace steamcorder::ui {

void DrawSettingsTab(AppState& app) {
    if (ImGui::BeginTabItem("Settings")) {
        ImGui::Spacing();
        ImGui::Text("Setup");
        ImGui::Separator();

        ImGui::Text("Folder Path:");
        ImGui::SameLine();
        ImGui::SetNextItemWidth(-90.0f);
        ImGui::InputText("##folder", app.form.folderBuffer, sizeof(app.form.folderBuffer));
        ImGui::SameLine();
        if (ImGui::Button("Browse", ImVec2(80, 0))) {
            app.form.showFolderBrowser = true;
        }

        ImGui::Text("Webhook URL:");
        ImGui::SameLine();
        ImGui::SetNextItemWidth(-90.0f);
        ImGuiInputTextFlags webhookFlags = app.settings.webhookHidden ? ImGuiInputTextFlags_Password : 0;
        ImGui::InputText("##webhook", app.form.webhookBuffer, sizeof(app.form.webhookBuffer), webhookFlags);
        ImGui::SameLine();
        if (ImGui::Button(app.settings.webhookHidden ? "Show" : "Hide", ImVec2(80, 0))) {
            app.SetWebhookHidden(!app.settings.webhookHidden);
        }

        ImGui::Text("Upload");
        ImGui::Separator();
        ImGui::SliderInt("Upload Delay (sec)", &app.form.uploadDelay,
                         domain::kMinUploadDelaySeconds, domain::kMaxUploadDelaySeconds);
        ImGui::Checkbox("Delete files after upload", &app.form.deleteAfterUpload);

        ImGui::Spacing();
        if (ImGui::Button("Save Settings", ImVec2(150, 30))) {
            app.SaveSettings();
        }
        ImGui::SameLine();
        if (ImGui::Button("How to Use", ImVec2(150, 30))) {
            app.ui.showHowTo = true;
        }

        ImGui::Spacing();
        ImGui::TextDisabled("Settings file: %s", app.settingsPath.string().c_str());

        ImGui::EndTabItem();
    }
}

} // namespace steamcorder::ui

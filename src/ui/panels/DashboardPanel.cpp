#include "ui/panels/MainPanels.hpp"
#include "ui/UiUtils.hpp"
#include "imgui.h"

namespace steamcorder::ui {

void DrawDashboardTab(AppState& app) {
    auto label = [&app](const char* withEmoji, const char* plain) {
        return app.ui.emojiEnabled ? withEmoji : plain;
    };

    if (ImGui::BeginTabItem(label("📷 Dashboard", "Dashboard"))) {
        ImGui::Spacing();
        ImGui::Text("Monitoring Control");
        ImGui::Separator();

        const bool monitoring = app.IsMonitoring();
        const char* buttonLabel = monitoring
            ? label("⏹ Stop Monitoring", "Stop Monitoring")
            : label("▶ Start Monitoring", "Start Monitoring");
        if (ImGui::Button(buttonLabel, ImVec2(-1, 50))) {
            app.ToggleMonitoring();
        }

        ImGui::Spacing();
        ImVec4 statusColor = monitoring ? ImVec4(0.40f, 0.85f, 0.40f, 1.0f) : ImVec4(0.70f, 0.70f, 0.70f, 1.0f);
        ImGui::TextColored(statusColor, "Status: %s", app.ui.statusText.c_str());
        if (monitoring) {
            ImGui::SameLine();
            ImGui::TextDisabled("(%s, delay %d s%s)",
                                app.settings.watchDirectory.c_str(),
                                app.session->GetDelaySeconds(),
                                app.session->GetDeleteAfterUpload() ? ", delete after upload" : "");
        }

        ImGui::Separator();
        ImGui::Text("Log:");
        ImGui::SameLine();
        if (ImGui::SmallButton("Clear")) {
            app.ui.logLines.clear();
        }
        ImGui::SameLine();
        ImGui::Checkbox("Auto-scroll", &app.ui.autoScrollLog);

        ImGui::BeginChild("Log", ImVec2(0, 0), true, ImGuiWindowFlags_HorizontalScrollbar);
        for (const auto& line : app.ui.logLines) {
            ImGui::TextDisabled("[%s]", FormatClock(line.timestampMs).c_str());
            ImGui::SameLine();
            ImGui::PushStyleColor(ImGuiCol_Text, LogLevelColor(line.level));
            ImGui::TextUnformatted(line.message.c_str());
            ImGui::PopStyleColor();
        }
        if (app.ui.autoScrollLog && ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
            ImGui::SetScrollHereY(1.0f);
        ImGui::EndChild();

        ImGui::EndTabItem();
    }
}

} // namespace steamcorder::ui

#pragma once

#include "ui/AppState.hpp"

namespace steamcorder::ui {

// Tabs
void DrawDashboardTab(AppState& app);
void DrawSettingsTab(AppState& app);

// Components
void DrawMainTabs(AppState& app);

// Modals
void DrawHowToModal(AppState& app);
void DrawFolderBrowserModal(AppState& app);
void DrawAllModals(AppState& app);

// Main Blocks
void DrawMenuBar(AppState& app);
void DrawMainWindow(AppState& app);

} // namespace steamcorder::ui

/**
 * @file UiRenderer.cpp
 * @brief Implementation of the UI rendering entry point.
 */
#include "ui/UiRenderer.hpp"

#include "ui/panels/MainPanels.hpp"

namespace steamcorder::ui {

void DrawUI(AppState& app) {
    app.PumpLog();
    DrawMainWindow(app);
    DrawAllModals(app);
}

} // namespace steamcorder::ui

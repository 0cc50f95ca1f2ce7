/**
 * @file SteamcorderApp.hpp
 * @brief Main application class for Steamcorder.
 */

#pragma once

#include "ui/AppState.hpp"

struct SDL_Window;

namespace steamcorder::app {

/**
 * @class SteamcorderApp
 * @brief Orchestrates the application lifecycle, including initialization, the main loop, and shutdown.
 */
class SteamcorderApp {
public:
    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Builds the monitoring services, then initializes SDL, OpenGL and ImGui.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Stops monitoring and cleans up all resources before exiting.
     */
    void Shutdown();

    ui::AppState m_state; ///< Settings, log and the monitoring session.
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false; ///< Flag indicating SDL initialization status.
    bool m_imguiInitialized = false; ///< Flag indicating ImGui initialization status.
};

} // namespace steamcorder::app

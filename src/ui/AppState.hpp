/**
 * @file AppState.hpp
 * @brief Core application state and UI logic coordination.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "application/LogChannel.hpp"
#include "application/WatchSession.hpp"
#include "domain/LogEvent.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace steamcorder::ui {

    /**
     * @struct SettingsForm
     * @brief Edit buffers behind the Settings tab. Applied on "Save Settings".
     */
    struct SettingsForm {
        char folderBuffer[512] = "";    ///< Watch folder text input.
        char webhookBuffer[1024] = "";  ///< Webhook URL text input.
        int uploadDelay = 2;
        bool deleteAfterUpload = false;
        bool showFolderBrowser = false;
    };

    /**
     * @struct UiState
     * @brief State for UI flags, the rendered log and navigation.
     */
    struct UiState {
        std::vector<domain::LogEvent> logLines; ///< Drained from the LogChannel, newest last.
        std::string statusText = "Idle";
        bool emojiEnabled = false;
        bool requestExit = false;
        bool showHowTo = false;
        bool autoScrollLog = true;
    };

    /**
     * @struct AppState
     * @brief State containing all data needed for UI rendering and the monitoring lifecycle.
     *
     * Lives on the render thread. The worker only reaches it through the LogChannel.
     */
    struct AppState {
        static constexpr std::size_t kMaxLogLines = 2000;

        infrastructure::AppSettings settings; ///< Last persisted settings.
        std::filesystem::path settingsPath;   ///< Where settings are read from and saved to.
        SettingsForm form;
        UiState ui;

        std::shared_ptr<application::LogChannel> log;
        std::unique_ptr<application::WatchSession> session; ///< The single monitoring session.

        AppState() = default;
        ~AppState();

        /** @brief Installs the log channel and session built by the composition root. */
        void InjectSession(std::shared_ptr<application::LogChannel> logChannel,
                           std::unique_ptr<application::WatchSession> watchSession);

        /** @brief Loads settings from settingsPath and refreshes the form buffers. */
        void LoadSettings();
        /** @brief Copies the form into settings, persists them and updates a running session. */
        bool SaveSettings();
        /** @brief Persists the webhook_hidden flag on its own. */
        void SetWebhookHidden(bool hidden);

        /** @brief Starts monitoring with freshly reloaded settings. */
        bool StartMonitoring();
        /** @brief Stops monitoring and remembers that it is off. */
        void StopMonitoring();
        void ToggleMonitoring();
        bool IsMonitoring() const;
        /** @brief Restarts monitoring if it was active when the app last closed. */
        void ResumeIfActive();

        /** @brief Moves pending LogChannel events into ui.logLines. Call once per frame. */
        void PumpLog();
        /** @brief Adds a UI-originated entry to the log. */
        void AppendLog(domain::LogLevel level, const std::string& message);

    private:
        void SyncFormFromSettings();
        bool PersistSettings();
    };

} // namespace steamcorder::ui

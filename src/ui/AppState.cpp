/**
 * @file AppState.cpp
 * @brief Implementation of the AppState class and state management logic.
 */
#include "ui/AppState.hpp"

#include <cstddef>
#include <cstdio>
#include <iostream>
#include <iterator>

#include "ui/UiFileBrowser.hpp"

namespace steamcorder::ui {

AppState::~AppState() {
    if (session) {
        session->Stop();
    }
}

void AppState::InjectSession(std::shared_ptr<application::LogChannel> logChannel,
                             std::unique_ptr<application::WatchSession> watchSession) {
    log = std::move(logChannel);
    session = std::move(watchSession);
}

void AppState::LoadSettings() {
    settings = infrastructure::ConfigLoader::Load(settingsPath);
    SyncFormFromSettings();
}

void AppState::SyncFormFromSettings() {
    SetPathBuffer(form.folderBuffer, sizeof(form.folderBuffer), settings.watchDirectory);
    std::snprintf(form.webhookBuffer, sizeof(form.webhookBuffer), "%s", settings.webhookUrl.c_str());
    form.uploadDelay = settings.uploadDelaySeconds;
    form.deleteAfterUpload = settings.deleteAfterUpload;
}

bool AppState::PersistSettings() {
    if (!infrastructure::ConfigLoader::Save(settingsPath, settings)) {
        AppendLog(domain::LogLevel::Error, "Could not save settings to " + settingsPath.string());
        return false;
    }
    return true;
}

bool AppState::SaveSettings() {
    settings.watchDirectory = form.folderBuffer;
    settings.webhookUrl = form.webhookBuffer;
    settings.uploadDelaySeconds = domain::ClampUploadDelay(form.uploadDelay);
    settings.deleteAfterUpload = form.deleteAfterUpload;
    if (!PersistSettings()) {
        return false;
    }
    AppendLog(domain::LogLevel::Info, "Settings saved.");

    // Delay and delete flag apply to the running session without a restart.
    if (IsMonitoring()) {
        session->UpdateDelay(settings.uploadDelaySeconds);
        session->UpdateDeleteAfterUpload(settings.deleteAfterUpload);
    }
    return true;
}

void AppState::SetWebhookHidden(bool hidden) {
    settings.webhookHidden = hidden;
    PersistSettings();
}

bool AppState::StartMonitoring() {
    if (!session) return false;

    // Reload to pick up the latest persisted values.
    settings = infrastructure::ConfigLoader::Load(settingsPath);
    if (settings.webhookUrl.empty()) {
        AppendLog(domain::LogLevel::Error, "Please enter a webhook URL.");
        return false;
    }
    if (settings.watchDirectory.empty()) {
        AppendLog(domain::LogLevel::Error, "Please select a folder path.");
        return false;
    }

    auto result = session->Start(infrastructure::ConfigLoader::ToWatchConfig(settings));
    if (result != application::WatchSession::StartResult::Started) {
        std::cerr << "[AppState] Monitoring not started: "
                  << application::WatchSession::ToString(result) << std::endl;
        ui.statusText = "Idle";
        return false;
    }

    settings.monitoringActive = true;
    PersistSettings();
    ui.statusText = "Monitoring";
    return true;
}

void AppState::StopMonitoring() {
    if (!session) return;
    session->Stop();
    settings.monitoringActive = false;
    PersistSettings();
    ui.statusText = "Stopped";
}

void AppState::ToggleMonitoring() {
    if (IsMonitoring()) {
        StopMonitoring();
    } else {
        StartMonitoring();
    }
}

bool AppState::IsMonitoring() const {
    return session && session->GetState() == application::WatchSession::State::Running;
}

void AppState::ResumeIfActive() {
    if (settings.monitoringActive && !settings.webhookUrl.empty() && !settings.watchDirectory.empty()) {
        StartMonitoring();
    }
}

void AppState::PumpLog() {
    if (!log) return;
    auto events = log->drain();
    ui.logLines.insert(ui.logLines.end(),
                       std::make_move_iterator(events.begin()),
                       std::make_move_iterator(events.end()));
    if (ui.logLines.size() > kMaxLogLines) {
        ui.logLines.erase(ui.logLines.begin(), ui.logLines.end() - static_cast<std::ptrdiff_t>(kMaxLogLines));
    }

    // The worker can die on its own (watched folder deleted).
    if (ui.statusText == "Monitoring" && !IsMonitoring()) {
        ui.statusText = "Stopped";
    }
}

void AppState::AppendLog(domain::LogLevel level, const std::string& message) {
    if (log) {
        log->publish(level, message);
    }
}

} // namespace steamcorder::ui

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace steamcorder::ui {

/**
 * @brief Safely sets a path to a character buffer.
 */
void SetPathBuffer(char* buffer, size_t bufferSize, const std::filesystem::path& path);

/**
 * @brief Draws an interactive folder browser for picking the watch folder.
 *
 * Shows shortcut roots (home, Pictures, Steam userdata when present) and how many
 * supported images the highlighted folder already holds.
 * @return True if a folder was selected.
 */
bool DrawFolderBrowser(const char* id, char* pathBuffer, size_t bufferSize, const std::string& fallbackRoot);

} // namespace steamcorder::ui

#pragma once

#include "domain/LogEvent.hpp"
#include "imgui.h"
#include <cstdint>
#include <string>
#include <ctime>

namespace steamcorder::ui {

/**
 * @brief Converts time_t to tm using platform-specific safe functions.
 */
std::tm ToLocalTime(std::time_t tt);

/**
 * @brief Formats epoch milliseconds as local HH:MM:SS.
 */
std::string FormatClock(std::int64_t timestampMs);

/**
 * @brief Text colour for a log level in the dashboard log.
 */
ImVec4 LogLevelColor(domain::LogLevel level);

} // namespace steamcorder::ui

/**
 * @file LogEvent.hpp
 * @brief User-facing log entry emitted by the monitoring pipeline.
 */

#pragma once

#include <cstdint>
#include <string>

namespace steamcorder::domain {

enum class LogLevel {
    Info,
    Success,
    Warning,
    Error
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "info";
        case LogLevel::Success: return "success";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "info";
}

/**
 * @struct LogEvent
 * @brief The only artifact the pipeline hands to the presentation layer.
 */
struct LogEvent {
    std::int64_t timestampMs = 0; ///< Milliseconds since the Unix epoch.
    LogLevel level = LogLevel::Info;
    std::string message;
};

} // namespace steamcorder::domain

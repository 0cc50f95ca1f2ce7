#include "ui/UiUtils.hpp"

namespace steamcorder::ui {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatClock(std::int64_t timestampMs) {
    std::tm tm = ToLocalTime(static_cast<std::time_t>(timestampMs / 1000));
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm);
    return buffer;
}

ImVec4 LogLevelColor(domain::LogLevel level) {
    switch (level) {
        case domain::LogLevel::Success: return ImVec4(0.40f, 0.85f, 0.40f, 1.0f);
        case domain::LogLevel::Warning: return ImVec4(1.00f, 0.80f, 0.25f, 1.0f);
        case domain::LogLevel::Error: return ImVec4(1.00f, 0.40f, 0.40f, 1.0f);
        case domain::LogLevel::Info: break;
    }
    return ImVec4(0.85f, 0.85f, 0.85f, 1.0f);
}

} // namespace steamcorder::ui

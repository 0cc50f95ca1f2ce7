/**
 * @file LogChannel.cpp
 * @brief Implementation of LogChannel.
 */

#include "application/LogChannel.hpp"

#include <chrono>
#include <iostream>
#include <iterator>

namespace steamcorder::application {

LogChannel::LogChannel(std::size_t capacity, bool echoToConsole)
    : m_capacity(capacity == 0 ? 1 : capacity), m_echoToConsole(echoToConsole) {}

void LogChannel::publish(domain::LogLevel level, const std::string& message) {
    domain::LogEvent event;
    event.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    event.level = level;
    event.message = message;

    if (m_echoToConsole) {
        auto& out = (level == domain::LogLevel::Error || level == domain::LogLevel::Warning) ? std::cerr : std::cout;
        out << "[Steamcorder] [" << domain::ToString(level) << "] " << message << std::endl;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.size() >= m_capacity) {
        m_events.pop_front();
        ++m_dropped;
    }
    m_events.push_back(std::move(event));
}

std::vector<domain::LogEvent> LogChannel::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::LogEvent> out(std::make_move_iterator(m_events.begin()),
                                      std::make_move_iterator(m_events.end()));
    m_events.clear();
    return out;
}

std::size_t LogChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

} // namespace steamcorder::application

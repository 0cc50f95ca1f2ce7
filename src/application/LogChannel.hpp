/**
 * @file LogChannel.hpp
 * @brief Bounded queue carrying LogEvents from the monitoring worker to the UI.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "domain/LogEvent.hpp"

namespace steamcorder::application {

/**
 * @class LogChannel
 * @brief Thread-safe, bounded, drop-oldest log queue.
 *
 * The worker publishes, the render loop drains once per frame. Every event is
 * also echoed to the console.
 */
class LogChannel {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit LogChannel(std::size_t capacity = kDefaultCapacity, bool echoToConsole = true);

    /** @brief Timestamps and enqueues a message. */
    void publish(domain::LogLevel level, const std::string& message);

    void info(const std::string& message) { publish(domain::LogLevel::Info, message); }
    void success(const std::string& message) { publish(domain::LogLevel::Success, message); }
    void warning(const std::string& message) { publish(domain::LogLevel::Warning, message); }
    void error(const std::string& message) { publish(domain::LogLevel::Error, message); }

    /** @brief Removes and returns all pending events, oldest first. */
    std::vector<domain::LogEvent> drain();

    /** @brief Number of events discarded because the queue was full. */
    std::size_t droppedCount() const;

    std::size_t capacity() const { return m_capacity; }

private:
    const std::size_t m_capacity;
    const bool m_echoToConsole;
    mutable std::mutex m_mutex;
    std::deque<domain::LogEvent> m_events;
    std::size_t m_dropped = 0;
};

} // namespace steamcorder::application

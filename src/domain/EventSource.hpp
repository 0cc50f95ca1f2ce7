/**
 * @file EventSource.hpp
 * @brief Interface for directory watchers that report newly created entries.
 */

#pragma once

#include <chrono>
#include <string>

namespace steamcorder::domain {

/**
 * @struct WatchNotification
 * @brief One result of EventSource::nextEvent().
 */
struct WatchNotification {
    enum class Kind {
        Created, ///< A new entry appeared in the watched directory.
        Stopped, ///< stopWatching() was called; no more events will follow.
        Failed   ///< The watch broke (e.g. directory removed); see error.
    };

    Kind kind = Kind::Stopped;
    std::string path;                                ///< Full path of the created entry.
    bool isDirectory = false;
    std::chrono::steady_clock::time_point detectedAt; ///< When the event was read.
    std::string error;
};

/**
 * @class EventSource
 * @brief Abstract directory watcher consumed by WatchSession.
 *
 * nextEvent() is called from the session worker only; stopWatching() may be
 * called from any thread and must unblock a pending nextEvent().
 */
class EventSource {
public:
    virtual ~EventSource() = default;

    /**
     * @brief Starts watching a directory for creation events.
     * @return False if the watch could not be registered.
     */
    virtual bool watch(const std::string& directory, bool recursive = false) = 0;

    /** @brief Blocks until an entry is created, the source is stopped or it fails. */
    virtual WatchNotification nextEvent() = 0;

    /** @brief Stops emitting events. Safe to call more than once. */
    virtual void stopWatching() = 0;

    /** @brief Human readable reason for the last watch() failure. */
    virtual std::string lastError() const { return {}; }
};

} // namespace steamcorder::domain

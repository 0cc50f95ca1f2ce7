/**
 * @file InotifyEventSource.hpp
 * @brief Linux inotify implementation of domain::EventSource.
 */

#pragma once

#include <atomic>
#include <deque>
#include <string>

#include "domain/EventSource.hpp"

namespace steamcorder::infrastructure {

/**
 * @class InotifyEventSource
 * @brief Reports IN_CREATE events for a single directory.
 *
 * nextEvent() polls the inotify descriptor together with an eventfd that
 * stopWatching() signals, so a blocked worker wakes up immediately.
 */
class InotifyEventSource : public domain::EventSource {
public:
    InotifyEventSource();
    ~InotifyEventSource() override;

    InotifyEventSource(const InotifyEventSource&) = delete;
    InotifyEventSource& operator=(const InotifyEventSource&) = delete;

    bool watch(const std::string& directory, bool recursive = false) override;
    domain::WatchNotification nextEvent() override;
    void stopWatching() override;
    std::string lastError() const override { return m_lastError; }

private:
    /** @brief Reads one batch from the inotify fd into m_pending, or records m_failure. */
    void ReadBatch();

    int m_inotifyFd = -1;
    int m_wakeFd = -1;
    int m_watchDescriptor = -1;
    std::string m_directory;
    std::string m_lastError;
    std::string m_failure;
    std::atomic<bool> m_stopped{false};
    std::deque<domain::WatchNotification> m_pending;
};

} // namespace steamcorder::infrastructure

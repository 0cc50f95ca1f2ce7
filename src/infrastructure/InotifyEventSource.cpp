/**
 * @file InotifyEventSource.cpp
 * @brief Implementation of InotifyEventSource.
 */

#include "infrastructure/InotifyEventSource.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace steamcorder::infrastructure {

namespace {
constexpr std::size_t kEventBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);
}

InotifyEventSource::InotifyEventSource() {
    m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotifyFd < 0) {
        m_lastError = std::string("inotify_init1 failed: ") + std::strerror(errno);
        std::cerr << "[InotifyEventSource] " << m_lastError << std::endl;
    }
    m_wakeFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (m_wakeFd < 0) {
        m_lastError = std::string("eventfd failed: ") + std::strerror(errno);
        std::cerr << "[InotifyEventSource] " << m_lastError << std::endl;
    }
}

InotifyEventSource::~InotifyEventSource() {
    if (m_inotifyFd >= 0) {
        if (m_watchDescriptor >= 0) {
            inotify_rm_watch(m_inotifyFd, m_watchDescriptor);
        }
        close(m_inotifyFd);
    }
    if (m_wakeFd >= 0) {
        close(m_wakeFd);
    }
}

bool InotifyEventSource::watch(const std::string& directory, bool recursive) {
    if (m_inotifyFd < 0 || m_wakeFd < 0) {
        return false;
    }
    if (recursive) {
        std::cerr << "[InotifyEventSource] Recursive watching is not supported; watching top level only." << std::endl;
    }

    m_watchDescriptor = inotify_add_watch(m_inotifyFd, directory.c_str(), IN_CREATE | IN_DELETE_SELF | IN_ONLYDIR);
    if (m_watchDescriptor < 0) {
        m_lastError = std::string("inotify_add_watch failed: ") + std::strerror(errno);
        std::cerr << "[InotifyEventSource] " << m_lastError << " (" << directory << ")" << std::endl;
        return false;
    }
    m_directory = directory;
    m_stopped = false;
    return true;
}

domain::WatchNotification InotifyEventSource::nextEvent() {
    domain::WatchNotification stopped;
    stopped.kind = domain::WatchNotification::Kind::Stopped;

    while (!m_stopped.load()) {
        if (!m_pending.empty()) {
            auto event = std::move(m_pending.front());
            m_pending.pop_front();
            return event;
        }
        if (!m_failure.empty()) {
            domain::WatchNotification failed;
            failed.kind = domain::WatchNotification::Kind::Failed;
            failed.error = m_failure;
            return failed;
        }

        struct pollfd fds[2];
        fds[0].fd = m_inotifyFd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = m_wakeFd;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            domain::WatchNotification failed;
            failed.kind = domain::WatchNotification::Kind::Failed;
            failed.error = std::string("poll failed: ") + std::strerror(errno);
            return failed;
        }
        if (fds[1].revents & POLLIN) {
            break;
        }
        if (fds[0].revents & POLLIN) {
            ReadBatch();
        }
    }
    return stopped;
}

void InotifyEventSource::stopWatching() {
    if (m_stopped.exchange(true)) {
        return;
    }
    if (m_wakeFd >= 0) {
        std::uint64_t one = 1;
        if (write(m_wakeFd, &one, sizeof(one)) < 0) {
            std::cerr << "[InotifyEventSource] Failed to signal stop: " << std::strerror(errno) << std::endl;
        }
    }
}

void InotifyEventSource::ReadBatch() {
    alignas(struct inotify_event) char buffer[kEventBufferSize];
    ssize_t length = read(m_inotifyFd, buffer, sizeof(buffer));
    if (length < 0) {
        if (errno != EAGAIN && errno != EINTR) {
            m_failure = std::string("read failed: ") + std::strerror(errno);
        }
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    for (char* ptr = buffer; ptr < buffer + length;) {
        auto* raw = reinterpret_cast<struct inotify_event*>(ptr);
        ptr += sizeof(struct inotify_event) + raw->len;

        if (raw->mask & IN_Q_OVERFLOW) {
            std::cerr << "[InotifyEventSource] Event queue overflow; some files may have been missed." << std::endl;
            continue;
        }
        if (raw->mask & (IN_DELETE_SELF | IN_IGNORED)) {
            m_failure = "watched directory was removed: " + m_directory;
            return;
        }
        if ((raw->mask & IN_CREATE) && raw->len > 0) {
            domain::WatchNotification event;
            event.kind = domain::WatchNotification::Kind::Created;
            event.path = (std::filesystem::path(m_directory) / raw->name).string();
            event.isDirectory = (raw->mask & IN_ISDIR) != 0;
            event.detectedAt = now;
            m_pending.push_back(std::move(event));
        }
    }
}

} // namespace steamcorder::infrastructure

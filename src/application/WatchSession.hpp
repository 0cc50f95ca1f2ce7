/**
 * @file WatchSession.hpp
 * @brief Monitoring session binding a directory watch to the upload pipeline.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "application/LogChannel.hpp"
#include "application/StabilityChecker.hpp"
#include "domain/EventSource.hpp"
#include "domain/UploadResult.hpp"
#include "domain/Uploader.hpp"
#include "domain/WatchConfig.hpp"

namespace steamcorder::application {

/**
 * @class WatchSession
 * @brief Owns one watched directory and the single worker that processes its events.
 *
 * States move Idle -> Running -> Stopping -> Idle. Events are handled strictly
 * one after another on the worker: stability check, delay, extension filter,
 * upload, optional delete. A failure on one file is logged and never ends the
 * session.
 */
class WatchSession {
public:
    enum class State {
        Idle,
        Running,
        Stopping
    };

    enum class StartResult {
        Started,
        InvalidConfig,  ///< Directory missing or webhook URL empty.
        AlreadyRunning,
        WatchFailed     ///< The event source refused the directory.
    };

    using EventSourceFactory = std::function<std::unique_ptr<domain::EventSource>()>;

    WatchSession(EventSourceFactory eventSourceFactory,
                 std::shared_ptr<domain::Uploader> uploader,
                 std::shared_ptr<LogChannel> log,
                 StabilityChecker stabilityChecker = StabilityChecker());
    ~WatchSession();

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;

    /** @brief Validates the config, starts the watch and spawns the worker. */
    StartResult Start(const domain::WatchConfig& config);

    /**
     * @brief Stops the watch and joins the worker.
     *
     * The file being processed, if any, finishes its pipeline first. No-op when Idle.
     */
    void Stop();

    /** @brief Changes the delay applied to in-flight and future files (clamped to 0..30). */
    void UpdateDelay(int seconds);

    /** @brief Toggles delete-after-upload for in-flight and future files. */
    void UpdateDeleteAfterUpload(bool enabled);

    State GetState() const;
    int GetDelaySeconds() const { return m_delaySeconds.load(); }
    bool GetDeleteAfterUpload() const { return m_deleteAfterUpload.load(); }

    /** @brief Runs one creation event through the pipeline. Used by the worker. */
    domain::UploadResult ProcessEvent(const domain::WatchNotification& event);

    static const char* ToString(State state);
    static const char* ToString(StartResult result);

private:
    void WorkerLoop();
    bool IsAllowedExtension(const std::string& path) const;

    EventSourceFactory m_eventSourceFactory;
    std::shared_ptr<domain::Uploader> m_uploader;
    std::shared_ptr<LogChannel> m_log;
    StabilityChecker m_stabilityChecker;

    domain::WatchConfig m_config;
    std::atomic<int> m_delaySeconds{0};
    std::atomic<bool> m_deleteAfterUpload{false};

    std::atomic<State> m_state{State::Idle};
    std::atomic<bool> m_workerFinished{true};
    std::mutex m_lifecycleMutex;
    std::unique_ptr<domain::EventSource> m_source;
    std::thread m_worker;
};

} // namespace steamcorder::application

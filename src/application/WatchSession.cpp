/**
 * @file WatchSession.cpp
 * @brief Implementation of WatchSession.
 */

#include "application/WatchSession.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace steamcorder::application {

namespace fs = std::filesystem;

namespace {

std::string FormatSeconds(std::int64_t milliseconds) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(milliseconds) / 1000.0);
    return buffer;
}

std::int64_t MillisecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

std::optional<std::string> ReadWholeFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

} // namespace

WatchSession::WatchSession(EventSourceFactory eventSourceFactory,
                           std::shared_ptr<domain::Uploader> uploader,
                           std::shared_ptr<LogChannel> log,
                           StabilityChecker stabilityChecker)
    : m_eventSourceFactory(std::move(eventSourceFactory)),
      m_uploader(std::move(uploader)),
      m_log(std::move(log)),
      m_stabilityChecker(std::move(stabilityChecker)) {}

WatchSession::~WatchSession() {
    Stop();
}

WatchSession::StartResult WatchSession::Start(const domain::WatchConfig& config) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    // A worker that died on an event source failure still needs joining.
    if (m_state.load() == State::Running && m_workerFinished.load()) {
        if (m_worker.joinable()) m_worker.join();
        m_source.reset();
        m_state = State::Idle;
    }
    if (m_state.load() != State::Idle) {
        return StartResult::AlreadyRunning;
    }

    std::error_code ec;
    if (config.webhookUrl.empty()) {
        m_log->error("No webhook URL set! Please enter one.");
        return StartResult::InvalidConfig;
    }
    if (config.directory.empty() || !fs::is_directory(config.directory, ec)) {
        m_log->error("Watch folder does not exist: " + config.directory);
        return StartResult::InvalidConfig;
    }

    std::unique_ptr<domain::EventSource> source;
    if (m_eventSourceFactory) {
        source = m_eventSourceFactory();
    }
    if (!source || !source->watch(config.directory, false)) {
        std::string reason = source ? source->lastError() : "no event source available";
        m_log->error("Could not watch " + config.directory + ": " + reason);
        return StartResult::WatchFailed;
    }

    m_config = config;
    m_config.allowedExtensions.clear();
    for (std::string ext : config.allowedExtensions) {
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
        if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
        m_config.allowedExtensions.insert(ext);
    }
    m_delaySeconds = domain::ClampUploadDelay(config.uploadDelaySeconds);
    m_deleteAfterUpload = config.deleteAfterUpload;
    m_source = std::move(source);
    m_workerFinished = false;
    m_state = State::Running;

    m_log->info("Monitoring started: " + config.directory);
    m_worker = std::thread(&WatchSession::WorkerLoop, this);
    return StartResult::Started;
}

void WatchSession::Stop() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_state.load() == State::Idle) {
        return;
    }

    m_state = State::Stopping;
    if (m_source) {
        m_source->stopWatching();
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_source.reset();
    m_state = State::Idle;
    m_log->info("Monitoring stopped.");
}

void WatchSession::UpdateDelay(int seconds) {
    int clamped = domain::ClampUploadDelay(seconds);
    m_delaySeconds = clamped;
    if (m_state.load() == State::Running) {
        m_log->info("Updated upload delay to " + std::to_string(clamped) + " seconds.");
    }
}

void WatchSession::UpdateDeleteAfterUpload(bool enabled) {
    m_deleteAfterUpload = enabled;
}

WatchSession::State WatchSession::GetState() const {
    State state = m_state.load();
    if (state == State::Running && m_workerFinished.load()) {
        return State::Idle;
    }
    return state;
}

void WatchSession::WorkerLoop() {
    while (true) {
        domain::WatchNotification event = m_source->nextEvent();
        if (event.kind == domain::WatchNotification::Kind::Stopped) {
            break;
        }
        if (event.kind == domain::WatchNotification::Kind::Failed) {
            m_log->error("Monitoring halted: " + event.error);
            break;
        }

        try {
            ProcessEvent(event);
        } catch (const std::exception& e) {
            m_log->error("Error processing " + fs::path(event.path).filename().string() + ": " + e.what());
        }
    }
    m_workerFinished = true;
}

domain::UploadResult WatchSession::ProcessEvent(const domain::WatchNotification& event) {
    if (event.isDirectory) {
        return domain::UploadSkipped{"directory"};
    }

    const std::string name = fs::path(event.path).filename().string();
    const bool allowed = IsAllowedExtension(event.path);
    if (allowed) {
        m_log->info("Detected new screenshot: " + name);
    }

    auto stability = m_stabilityChecker.waitUntilStable(event.path);
    if (stability.outcome == StabilityChecker::Outcome::Vanished) {
        m_log->warning("Screenshot " + name + " vanished before it finished writing.");
        return domain::UploadSkipped{"vanished"};
    }
    if (stability.outcome == StabilityChecker::Outcome::TimedOut) {
        m_log->warning("Gave up waiting for " + name + " to finish writing.");
        return domain::UploadSkipped{"timed out"};
    }

    int delay = m_delaySeconds.load();
    if (delay > 0) {
        std::this_thread::sleep_for(std::chrono::seconds(delay));
    }

    if (!allowed) {
        m_log->warning("Ignored " + name + " (unsupported file type).");
        return domain::UploadSkipped{"unsupported type"};
    }

    auto contents = ReadWholeFile(event.path);
    if (!contents) {
        domain::UploadFailed failed{domain::UploadErrorKind::Unknown, "could not read file", 0};
        m_log->error("Error uploading " + name + ": " + failed.message);
        return failed;
    }

    domain::UploadRequest request;
    request.url = m_config.webhookUrl;
    request.fileName = name;
    request.contents = std::move(*contents);

    domain::UploadResult result = m_uploader->upload(request);

    if (auto* failed = std::get_if<domain::UploadFailed>(&result)) {
        if (failed->kind == domain::UploadErrorKind::HttpStatus) {
            m_log->error("Upload failed for " + name + ". Status code: " + std::to_string(failed->httpStatus));
        } else {
            m_log->error("Error uploading " + name + ": " + failed->message);
        }
        return result;
    }

    auto* success = std::get_if<domain::UploadSuccess>(&result);
    if (!success) {
        return result;
    }
    success->totalDurationMs = MillisecondsSince(event.detectedAt);
    m_log->success("Uploaded " + name + " in " + FormatSeconds(success->uploadDurationMs) +
                   " sec (total: " + FormatSeconds(success->totalDurationMs) + " sec).");

    if (m_deleteAfterUpload.load()) {
        std::error_code ec;
        if (fs::remove(event.path, ec)) {
            m_log->info("Deleted " + name + " after upload.");
        } else {
            m_log->warning("Could not delete " + name + " after upload: " +
                           (ec ? ec.message() : std::string("file not found")));
        }
    }
    return result;
}

bool WatchSession::IsAllowedExtension(const std::string& path) const {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return m_config.allowedExtensions.count(ext) > 0;
}

const char* WatchSession::ToString(State state) {
    switch (state) {
        case State::Idle: return "Idle";
        case State::Running: return "Running";
        case State::Stopping: return "Stopping";
    }
    return "Idle";
}

const char* WatchSession::ToString(StartResult result) {
    switch (result) {
        case StartResult::Started: return "started";
        case StartResult::InvalidConfig: return "invalid config";
        case StartResult::AlreadyRunning: return "already running";
        case StartResult::WatchFailed: return "watch failed";
    }
    return "unknown";
}

} // namespace steamcorder::application

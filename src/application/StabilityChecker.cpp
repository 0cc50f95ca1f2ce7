/**
 * @file StabilityChecker.cpp
 * @brief Implementation of StabilityChecker.
 */

#include "application/StabilityChecker.hpp"

#include <filesystem>
#include <system_error>
#include <thread>

namespace steamcorder::application {

StabilityChecker::StabilityChecker()
    : StabilityChecker(Options{}) {}

StabilityChecker::StabilityChecker(Options options, SizeProbe probe)
    : m_options(options), m_probe(std::move(probe)) {
    if (m_options.requiredStableSamples < 1) {
        m_options.requiredStableSamples = 1;
    }
    if (!m_probe) {
        m_probe = &StabilityChecker::FileSizeOnDisk;
    }
}

StabilityChecker::Report StabilityChecker::waitUntilStable(const std::string& path) const {
    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();

    Report report;
    std::optional<std::uintmax_t> previous;
    int stableRun = 0;

    while (true) {
        auto size = m_probe(path);
        ++report.samples;
        if (!size) {
            report.outcome = Outcome::Vanished;
            return report;
        }
        report.lastSize = *size;

        if (*size == 0) {
            // Empty placeholders never count towards stability.
            stableRun = 0;
        } else if (previous && *previous == *size) {
            ++stableRun;
        } else {
            stableRun = 1;
        }
        previous = size;

        if (stableRun >= m_options.requiredStableSamples) {
            report.outcome = Outcome::Ready;
            return report;
        }

        if (m_options.maxWait.count() > 0 && Clock::now() - started >= m_options.maxWait) {
            report.outcome = Outcome::TimedOut;
            return report;
        }

        std::this_thread::sleep_for(m_options.interval);
    }
}

const char* StabilityChecker::ToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Ready: return "ready";
        case Outcome::Vanished: return "vanished";
        case Outcome::TimedOut: return "timed out";
    }
    return "unknown";
}

std::optional<std::uintmax_t> StabilityChecker::FileSizeOnDisk(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

} // namespace steamcorder::application

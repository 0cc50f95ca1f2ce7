/**
 * @file StabilityChecker.hpp
 * @brief Waits for a freshly created file to stop growing.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace steamcorder::application {

/**
 * @class StabilityChecker
 * @brief Polls a file's size until it is unchanged and non-zero across a run of samples.
 *
 * Creation events fire as soon as the producer opens the file, long before the
 * image is flushed. The checker blocks the calling thread while sampling.
 */
class StabilityChecker {
public:
    enum class Outcome {
        Ready,    ///< Size stayed constant and non-zero for the required samples.
        Vanished, ///< The file disappeared between samples.
        TimedOut  ///< maxWait elapsed before the file settled.
    };

    struct Options {
        std::chrono::milliseconds interval{500};
        int requiredStableSamples = 3;
        std::chrono::milliseconds maxWait{std::chrono::seconds(120)}; ///< Zero waits forever.
    };

    struct Report {
        Outcome outcome = Outcome::Vanished;
        int samples = 0;            ///< Number of size samples taken.
        std::uintmax_t lastSize = 0;
    };

    /** @brief Returns the current size, or nullopt when the file no longer exists. */
    using SizeProbe = std::function<std::optional<std::uintmax_t>(const std::string&)>;

    StabilityChecker();
    explicit StabilityChecker(Options options, SizeProbe probe = nullptr);

    /** @brief Blocks until the file at path is Ready, Vanished or TimedOut. */
    Report waitUntilStable(const std::string& path) const;

    const Options& options() const { return m_options; }

    static const char* ToString(Outcome outcome);

private:
    static std::optional<std::uintmax_t> FileSizeOnDisk(const std::string& path);

    Options m_options;
    SizeProbe m_probe;
};

} // namespace steamcorder::application

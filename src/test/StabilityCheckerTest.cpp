#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

#include "application/StabilityChecker.hpp"

using steamcorder::application::StabilityChecker;

namespace {

// Replays a fixed list of sizes; nullopt means "file is gone".
StabilityChecker::SizeProbe ScriptedProbe(std::vector<std::optional<std::uintmax_t>> sizes, int* calls) {
    return [sizes, calls](const std::string&) -> std::optional<std::uintmax_t> {
        int index = (*calls)++;
        if (index >= static_cast<int>(sizes.size())) {
            return sizes.back();
        }
        return sizes[index];
    };
}

StabilityChecker::Options FastOptions() {
    StabilityChecker::Options options;
    options.interval = std::chrono::milliseconds(1);
    options.requiredStableSamples = 3;
    options.maxWait = std::chrono::milliseconds(0);
    return options;
}

} // namespace

int main() {
    std::cout << "[Test] Starting StabilityChecker Test..." << std::endl;

    // Already complete file: ready on the third identical sample.
    {
        int calls = 0;
        StabilityChecker checker(FastOptions(), ScriptedProbe({1024, 1024, 1024}, &calls));
        auto report = checker.waitUntilStable("shot.png");
        assert(report.outcome == StabilityChecker::Outcome::Ready);
        assert(report.samples == 3);
        assert(report.lastSize == 1024);
    }

    // Growing file: the run restarts every time the size changes.
    {
        int calls = 0;
        StabilityChecker checker(FastOptions(), ScriptedProbe({0, 0, 512, 1024, 1024, 2048, 2048, 2048}, &calls));
        auto report = checker.waitUntilStable("shot.png");
        assert(report.outcome == StabilityChecker::Outcome::Ready);
        assert(report.samples == 8);
        assert(report.lastSize == 2048);
    }

    // Vanishes mid-poll.
    {
        int calls = 0;
        StabilityChecker checker(FastOptions(), ScriptedProbe({100, 100, std::nullopt}, &calls));
        auto report = checker.waitUntilStable("shot.png");
        assert(report.outcome == StabilityChecker::Outcome::Vanished);
        assert(report.samples == 3);
    }

    // Zero-byte placeholder never settles; bounded wait turns it into TimedOut.
    {
        int calls = 0;
        auto options = FastOptions();
        options.maxWait = std::chrono::milliseconds(30);
        StabilityChecker checker(options, ScriptedProbe({0}, &calls));
        auto report = checker.waitUntilStable("empty.png");
        assert(report.outcome == StabilityChecker::Outcome::TimedOut);
        assert(report.lastSize == 0);
        assert(calls > 3);
    }

    // Default options match the documented polling contract.
    {
        StabilityChecker checker;
        assert(checker.options().interval == std::chrono::milliseconds(500));
        assert(checker.options().requiredStableSamples == 3);
    }

    // Real filesystem: missing file is Vanished immediately, written file becomes Ready.
    {
        namespace fs = std::filesystem;
        fs::path root = fs::temp_directory_path() / "steamcorder_stability_test";
        fs::remove_all(root);
        fs::create_directories(root);

        StabilityChecker checker(FastOptions());
        auto missing = checker.waitUntilStable((root / "missing.png").string());
        assert(missing.outcome == StabilityChecker::Outcome::Vanished);
        assert(missing.samples == 1);

        fs::path file = root / "written.png";
        {
            std::ofstream out(file, std::ios::binary);
            out << std::string(1024, 'x');
        }
        auto ready = checker.waitUntilStable(file.string());
        assert(ready.outcome == StabilityChecker::Outcome::Ready);
        assert(ready.lastSize == 1024);

        // File deleted while the checker waits on a zero-size placeholder.
        fs::path placeholder = root / "placeholder.png";
        { std::ofstream out(placeholder); }
        std::thread remover([placeholder]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            std::filesystem::remove(placeholder);
        });
        auto gone = checker.waitUntilStable(placeholder.string());
        remover.join();
        assert(gone.outcome == StabilityChecker::Outcome::Vanished);

        fs::remove_all(root);
    }

    std::cout << "[PASS] StabilityChecker Test." << std::endl;
    return 0;
}

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include "infrastructure/InotifyEventSource.hpp"

namespace fs = std::filesystem;
using steamcorder::domain::WatchNotification;
using steamcorder::infrastructure::InotifyEventSource;

int main() {
    std::cout << "[Test] Starting InotifyEventSource Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / "steamcorder_inotify_test";
    fs::remove_all(root);
    fs::create_directories(root);

    // Missing directory
    {
        InotifyEventSource source;
        assert(!source.watch((root / "missing").string()));
        assert(!source.lastError().empty());
    }

    // File and directory creation
    {
        InotifyEventSource source;
        assert(source.watch(root.string()));

        { std::ofstream out(root / "shot.png"); out << "data"; }
        fs::create_directories(root / "folder");

        auto first = source.nextEvent();
        assert(first.kind == WatchNotification::Kind::Created);
        assert(first.path == (root / "shot.png").string());
        assert(!first.isDirectory);

        auto second = source.nextEvent();
        assert(second.kind == WatchNotification::Kind::Created);
        assert(second.path == (root / "folder").string());
        assert(second.isDirectory);

        // Non-recursive: nothing from inside the subfolder.
        { std::ofstream out(root / "folder" / "nested.png"); out << "data"; }

        std::thread stopper([&source]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            source.stopWatching();
        });
        auto before = std::chrono::steady_clock::now();
        auto stopped = source.nextEvent();
        stopper.join();
        assert(stopped.kind == WatchNotification::Kind::Stopped);
        assert(std::chrono::steady_clock::now() - before < std::chrono::seconds(2));

        // Stays stopped, and stopping twice is harmless.
        source.stopWatching();
        assert(source.nextEvent().kind == WatchNotification::Kind::Stopped);
    }

    // Watched directory removed
    {
        fs::path doomed = root / "doomed";
        fs::create_directories(doomed);
        InotifyEventSource source;
        assert(source.watch(doomed.string()));
        fs::remove_all(doomed);

        auto event = source.nextEvent();
        assert(event.kind == WatchNotification::Kind::Failed);
        assert(!event.error.empty());
    }

    fs::remove_all(root);
    std::cout << "[PASS] InotifyEventSource Test." << std::endl;
    return 0;
}

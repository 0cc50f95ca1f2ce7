#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "application/LogChannel.hpp"

using steamcorder::application::LogChannel;
using steamcorder::domain::LogLevel;

int main() {
    std::cout << "[Test] Starting LogChannel Test..." << std::endl;

    {
        LogChannel channel(10, false);
        channel.info("Detected new screenshot: a.png");
        channel.success("Uploaded a.png");
        channel.warning("Ignored b.txt (unsupported file type).");
        channel.error("Upload failed for c.png. Status code: 500");

        auto events = channel.drain();
        assert(events.size() == 4);
        assert(events[0].level == LogLevel::Info);
        assert(events[1].level == LogLevel::Success);
        assert(events[2].level == LogLevel::Warning);
        assert(events[3].level == LogLevel::Error);
        assert(events[3].message == "Upload failed for c.png. Status code: 500");
        assert(events[0].timestampMs > 0);
        assert(events[0].timestampMs <= events[3].timestampMs);
        assert(channel.drain().empty());
    }

    // Bounded: the oldest entries go first.
    {
        LogChannel channel(3, false);
        for (int i = 0; i < 5; ++i) {
            channel.info("line " + std::to_string(i));
        }
        auto events = channel.drain();
        assert(events.size() == 3);
        assert(events[0].message == "line 2");
        assert(events[2].message == "line 4");
        assert(channel.droppedCount() == 2);
    }

    // Concurrent producers lose nothing below capacity.
    {
        LogChannel channel(1000, false);
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; ++t) {
            producers.emplace_back([&channel, t]() {
                for (int i = 0; i < 100; ++i) {
                    channel.info("producer " + std::to_string(t));
                }
            });
        }
        for (auto& p : producers) p.join();
        assert(channel.drain().size() == 400);
        assert(channel.droppedCount() == 0);
    }

    std::cout << "[PASS] LogChannel Test." << std::endl;
    return 0;
}

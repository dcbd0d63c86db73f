#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

#include "../events/event_channel.hpp"

namespace Webscout {
namespace Engine {

/**
 * Drains an EventChannel on its own thread and prints each finding as a
 * colored line. Exits once the channel is closed and empty.
 */
class ConsoleReporter {
public:
    explicit ConsoleReporter(EventChannel& channel);
    ~ConsoleReporter();

    ConsoleReporter(const ConsoleReporter&)            = delete;
    ConsoleReporter& operator=(const ConsoleReporter&) = delete;

    void start();
    void join();

    std::size_t printed() const {
        return printed_.load();
    }

    // Text of the line printed for `event`, without color.
    static std::string format(const CrawlEvent& event);
    static const char* color_for(EventType type);

private:
    EventChannel&            channel_;
    std::thread              thread_;
    std::atomic<std::size_t> printed_{0};

    void run();
    void print_summary(const StatsSnapshot& stats);
};

}  // namespace Engine
}  // namespace Webscout

#include "console_reporter.hpp"
#include "../../core/logger/logger.hpp"

namespace Webscout {
namespace Engine {

using namespace Webscout::Core;

ConsoleReporter::ConsoleReporter(EventChannel& channel) : channel_(channel) {
}

ConsoleReporter::~ConsoleReporter() {
    channel_.close();
    join();
}

void ConsoleReporter::start() {
    if (thread_.joinable())
        return;
    thread_ = std::thread(&ConsoleReporter::run, this);
}

void ConsoleReporter::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

const char* ConsoleReporter::color_for(EventType type) {
    switch (type) {
        case EventType::DiscoveredPage: return Color::GREEN;
        case EventType::DiscoveredEndpoint: return Color::CYAN;
        case EventType::DiscoveredFunction: return Color::BLUE;
        case EventType::FetchFailed: return Color::RED;
        case EventType::DepthLimitReached: return Color::YELLOW;
        case EventType::CrawlDone: return Color::GREEN;
    }
    return Color::RESET;
}

std::string ConsoleReporter::format(const CrawlEvent& event) {
    switch (event.type) {
        case EventType::DiscoveredPage: return "[PAGE] " + event.url;
        case EventType::DiscoveredEndpoint: return "[API] " + event.url;
        case EventType::DiscoveredFunction:
            return "[FUNC] " + event.name + "() in " + event.url;
        case EventType::FetchFailed: {
            std::string line = "[FAIL] " + event.url + " (";
            if (event.error == Network::Http::ErrorType::HttpStatus)
                line += "HTTP " + std::to_string(event.status);
            else
                line += Network::Http::to_string(event.error);
            return line + ")";
        }
        case EventType::DepthLimitReached:
            return "[DEPTH] " + event.url + " (depth " + std::to_string(event.depth) + ")";
        case EventType::CrawlDone:
            return "[DONE] " + std::to_string(event.stats.total_html) + " pages, "
                   + std::to_string(event.stats.total_backend) + " endpoints, "
                   + std::to_string(event.stats.total_functions) + " functions";
    }
    return "";
}

void ConsoleReporter::run() {
    while (auto event = channel_.pop()) {
        Logger::print(color_for(event->type), format(*event));
        printed_++;
        if (event->type == EventType::CrawlDone)
            print_summary(event->stats);
    }
}

void ConsoleReporter::print_summary(const StatsSnapshot& stats) {
    Logger::print(Color::CYAN,
                  "Fetched " + std::to_string(stats.fetched) + ", failed "
                      + std::to_string(stats.failed) + ", depth-limited "
                      + std::to_string(stats.depth_limited) + ", visited "
                      + std::to_string(stats.visited) + ", deepest level "
                      + std::to_string(stats.max_depth_seen));

    std::size_t dropped = channel_.dropped();
    if (dropped > 0)
        Logger::print(Color::YELLOW,
                      std::to_string(dropped) + " progress events dropped (buffer full)");
}

}  // namespace Engine
}  // namespace Webscout

#include "event.hpp"

namespace Webscout {
namespace Engine {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::DiscoveredPage: return "DiscoveredPage";
        case EventType::DiscoveredEndpoint: return "DiscoveredEndpoint";
        case EventType::DiscoveredFunction: return "DiscoveredFunction";
        case EventType::FetchFailed: return "FetchFailed";
        case EventType::DepthLimitReached: return "DepthLimitReached";
        case EventType::CrawlDone: return "CrawlDone";
    }
    return "Unknown";
}

CrawlEvent CrawlEvent::page(const std::string& url, int depth) {
    CrawlEvent event;
    event.type  = EventType::DiscoveredPage;
    event.url   = url;
    event.depth = depth;
    return event;
}

CrawlEvent CrawlEvent::endpoint(const std::string& url, int depth) {
    CrawlEvent event;
    event.type  = EventType::DiscoveredEndpoint;
    event.url   = url;
    event.depth = depth;
    return event;
}

CrawlEvent CrawlEvent::function(const std::string& name, const std::string& found_at) {
    CrawlEvent event;
    event.type = EventType::DiscoveredFunction;
    event.name = name;
    event.url  = found_at;
    return event;
}

CrawlEvent CrawlEvent::fetch_failed(const std::string& url, int depth, const Response& res) {
    CrawlEvent event;
    event.type    = EventType::FetchFailed;
    event.url     = url;
    event.depth   = depth;
    event.status  = res.status_code;
    event.error   = res.error_type;
    event.message = res.error;
    return event;
}

CrawlEvent CrawlEvent::depth_limit(const std::string& url, int depth) {
    CrawlEvent event;
    event.type  = EventType::DepthLimitReached;
    event.url   = url;
    event.depth = depth;
    return event;
}

CrawlEvent CrawlEvent::done(const StatsSnapshot& stats) {
    CrawlEvent event;
    event.type  = EventType::CrawlDone;
    event.stats = stats;
    return event;
}

}  // namespace Engine
}  // namespace Webscout

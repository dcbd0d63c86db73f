#pragma once
#include <functional>
#include <string>

#include "../../network/http/http_client.hpp"
#include "../results/result_set.hpp"

namespace Webscout {
namespace Engine {

enum class EventType {
    DiscoveredPage,
    DiscoveredEndpoint,
    DiscoveredFunction,
    FetchFailed,
    DepthLimitReached,
    CrawlDone
};

const char* to_string(EventType type);

struct CrawlEvent {
    EventType                type = EventType::CrawlDone;
    std::string              url;
    std::string              name;  // DiscoveredFunction
    int                      depth  = 0;
    long                     status = 0;  // FetchFailed with HttpStatus
    Network::Http::ErrorType error  = Network::Http::ErrorType::None;
    std::string              message;
    StatsSnapshot            stats;  // CrawlDone

    static CrawlEvent page(const std::string& url, int depth);
    static CrawlEvent endpoint(const std::string& url, int depth);
    static CrawlEvent function(const std::string& name, const std::string& found_at);
    static CrawlEvent fetch_failed(const std::string& url, int depth, const Response& res);
    static CrawlEvent depth_limit(const std::string& url, int depth);
    static CrawlEvent done(const StatsSnapshot& stats);
};

// Must not block: called on crawler threads.
using EventSink = std::function<void(const CrawlEvent&)>;

}  // namespace Engine
}  // namespace Webscout

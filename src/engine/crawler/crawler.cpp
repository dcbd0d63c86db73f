#include "crawler.hpp"
#include "../../core/logger/logger.hpp"
#include "../../network/http/beast_client.hpp"

namespace Webscout {
namespace Engine {

const char* to_string(CrawlState state) {
    switch (state) {
        case CrawlState::Idle: return "Idle";
        case CrawlState::Running: return "Running";
        case CrawlState::Draining: return "Draining";
        case CrawlState::Done: return "Done";
    }
    return "Unknown";
}

Crawler::Crawler(const CrawlerConfig& config, ClientFactory factory)
    : config_(config), client_factory_(std::move(factory)) {
    if (config_.threads < 1)
        config_.threads = 1;
    if (config_.concurrency < 1)
        config_.concurrency = 1;
}

void Crawler::set_event_sink(EventSink sink) {
    sink_ = std::move(sink);
}

std::unique_ptr<HttpClient> Crawler::create_client() {
    std::unique_ptr<HttpClient> client;
    if (client_factory_)
        client = client_factory_();
    else
        client = std::make_unique<BeastClient>();

    client->set_timeout(config_.request_timeout);
    client->set_max_body_size(config_.max_body_bytes);
    // Redirects come back through the frontier so they are scoped and claimed.
    client->set_max_redirects(0);
    client->set_user_agent(config_.user_agent);
    return client;
}

void Crawler::emit(const CrawlEvent& event) {
    if (sink_)
        sink_(event);
}

CrawlState Crawler::state() const {
    return state_.load();
}

ResultSnapshot Crawler::results() const {
    return results_.snapshot();
}

StatsSnapshot Crawler::stats() const {
    StatsSnapshot snapshot = stats_.snapshot(results_);
    snapshot.visited       = visited_.size();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        snapshot.queued = frontier_.size();
    }
    return snapshot;
}

const std::string& Crawler::seed() const {
    return seed_;
}

bool Crawler::seed_unreachable() const {
    return seed_unreachable_.load();
}

int Crawler::max_depth() const {
    return config_.max_depth;
}

}  // namespace Engine
}  // namespace Webscout

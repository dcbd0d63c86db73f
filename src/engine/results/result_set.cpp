#include "result_set.hpp"

namespace Webscout {
namespace Engine {

bool ResultSet::add_page(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.html_pages.insert(url).second;
}

bool ResultSet::add_endpoint(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.backend_endpoints.insert(url).second;
}

bool ResultSet::add_function(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.functions.insert(name).second;
}

ResultSnapshot ResultSet::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

std::size_t ResultSet::page_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.html_pages.size();
}

std::size_t ResultSet::endpoint_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.backend_endpoints.size();
}

std::size_t ResultSet::function_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.functions.size();
}

void CrawlStats::record_fetch(int depth) {
    fetched_++;
    int seen = max_depth_seen_.load();
    while (depth > seen && !max_depth_seen_.compare_exchange_weak(seen, depth)) {
    }
}

void CrawlStats::record_failure(Network::Http::ErrorType type) {
    failed_++;
    auto index = static_cast<std::size_t>(type);
    if (index < failures_by_kind_.size())
        failures_by_kind_[index]++;
}

void CrawlStats::record_depth_limit() {
    depth_limited_++;
}

int CrawlStats::failures_of(Network::Http::ErrorType type) const {
    auto index = static_cast<std::size_t>(type);
    return index < failures_by_kind_.size() ? failures_by_kind_[index].load() : 0;
}

StatsSnapshot CrawlStats::snapshot(const ResultSet& results) const {
    StatsSnapshot stats;
    stats.fetched        = fetched_.load();
    stats.failed         = failed_.load();
    stats.depth_limited  = depth_limited_.load();
    stats.max_depth_seen = max_depth_seen_.load();

    stats.total_html      = results.page_count();
    stats.total_backend   = results.endpoint_count();
    stats.total_functions = results.function_count();
    return stats;
}

}  // namespace Engine
}  // namespace Webscout

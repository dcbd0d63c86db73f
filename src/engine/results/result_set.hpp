#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>

#include "../../network/http/http_client.hpp"

namespace Webscout {
namespace Engine {

struct ResultSnapshot {
    std::set<std::string> html_pages;
    std::set<std::string> backend_endpoints;
    std::set<std::string> functions;
};

// Aggregated findings. Writers are serialized; readers get whole copies.
class ResultSet {
public:
    // Each returns true when the entry was not present before.
    bool add_page(const std::string& url);
    bool add_endpoint(const std::string& url);
    bool add_function(const std::string& name);

    ResultSnapshot snapshot() const;

    std::size_t page_count() const;
    std::size_t endpoint_count() const;
    std::size_t function_count() const;

private:
    mutable std::mutex mutex_;
    ResultSnapshot     data_;
};

struct StatsSnapshot {
    int         fetched         = 0;
    int         failed          = 0;
    int         depth_limited   = 0;
    int         max_depth_seen  = 0;
    std::size_t visited         = 0;
    std::size_t queued          = 0;
    std::size_t total_html      = 0;
    std::size_t total_backend   = 0;
    std::size_t total_functions = 0;
};

// Running counters for live progress; individually atomic, not a transaction.
class CrawlStats {
public:
    static constexpr std::size_t ERROR_KINDS =
        static_cast<std::size_t>(Network::Http::ErrorType::InvalidUrl) + 1;

    void record_fetch(int depth);
    void record_failure(Network::Http::ErrorType type);
    void record_depth_limit();

    int fetched() const {
        return fetched_.load();
    }
    int failed() const {
        return failed_.load();
    }
    int depth_limited() const {
        return depth_limited_.load();
    }
    int max_depth_seen() const {
        return max_depth_seen_.load();
    }
    int failures_of(Network::Http::ErrorType type) const;

    StatsSnapshot snapshot(const ResultSet& results) const;

private:
    std::atomic<int>                          fetched_{0};
    std::atomic<int>                          failed_{0};
    std::atomic<int>                          depth_limited_{0};
    std::atomic<int>                          max_depth_seen_{0};
    std::array<std::atomic<int>, ERROR_KINDS> failures_by_kind_{};
};

}  // namespace Engine
}  // namespace Webscout

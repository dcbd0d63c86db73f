#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawler.hpp"

namespace Webscout {
namespace Engine {

using namespace Webscout::Utils::Text;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 20;

struct WorkerGuard {
    std::atomic<int>& count;
    explicit WorkerGuard(std::atomic<int>& c) : count(c) {
    }
    ~WorkerGuard() {
        count--;
    }
};
}  // namespace

bool Crawler::add_target(const std::string& url, int depth, LinkContext context, int redirects) {
    auto normalized = Url::normalize(url);
    if (!normalized)
        return false;

    ResourceKind kind = classifier_->classify(*normalized, context);
    if (!is_traversable(kind))
        return false;

    // First claim wins; a later sighting in another context changes nothing.
    if (!visited_.try_claim(*normalized))
        return false;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    frontier_.push_back({std::move(*normalized), depth, kind, context, redirects});
    return true;
}

std::optional<CrawlTarget> Crawler::fetch_next_task() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (frontier_.empty())
        return std::nullopt;

    auto task = std::move(frontier_.front());
    frontier_.pop_front();
    active_workers_++;
    return task;
}

bool Crawler::should_stop_worker() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return cancelled_ || (active_workers_ == 0 && frontier_.empty());
}

boost::asio::awaitable<void> Crawler::worker_loop() {
    try {
        auto                      client = create_client();
        boost::asio::steady_timer timer(ioc_);

        while (!cancelled_) {
            auto task_opt = fetch_next_task();

            if (!task_opt) {
                if (should_stop_worker())
                    break;
                timer.expires_after(std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS));
                boost::system::error_code ec;
                co_await                  timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            {
                WorkerGuard guard(active_workers_);
                co_await    process_target(*client, std::move(*task_opt));
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
    }

    if (--live_workers_ == 0)
        trigger_done();
}

boost::asio::awaitable<void> Crawler::process_target(HttpClient& client, CrawlTarget target) {
    if (target.depth > config_.max_depth) {
        stats_.record_depth_limit();
        emit(CrawlEvent::depth_limit(target.url, target.depth));
        co_return;
    }

    Logger::info("Fetching: " + target.url + " (Depth " + std::to_string(target.depth) + ")");
    Response res = co_await client.get(target.url);

    if (res.is_redirect()) {
        handle_redirect(target, std::move(res));
        co_return;
    }

    if (res.success && !res.effective_url.empty()
        && !Url::is_same_domain(seed_, res.effective_url)) {
        res.success    = false;
        res.error_type = ErrorType::InvalidUrl;
        res.error      = "Response from out of scope URL " + res.effective_url;
    }

    if (!res.success) {
        handle_failure(target, res);
        co_return;
    }

    stats_.record_fetch(target.depth);
    handle_success(target, std::move(res));
}

void Crawler::handle_failure(const CrawlTarget& target, const Response& res) {
    stats_.record_failure(res.error_type);
    if (target.depth == 0 && res.error_type != ErrorType::HttpStatus)
        seed_unreachable_ = true;

    std::string reason = res.error.empty() ? to_string(res.error_type) : res.error;
    Logger::warn("Failed: " + target.url + " - " + reason);
    emit(CrawlEvent::fetch_failed(target.url, target.depth, res));
}

void Crawler::handle_redirect(const CrawlTarget& target, Response res) {
    auto next = Url::normalize(res.location, target.url);
    if (!next) {
        res.error_type = ErrorType::InvalidUrl;
        res.error      = "Unusable redirect target: " + res.location;
        handle_failure(target, res);
        return;
    }

    if (target.redirects >= config_.max_redirects) {
        res.error = "Too many redirects";
        handle_failure(target, res);
        return;
    }

    // Same depth: the redirect target stands in for the linked URL.
    if (add_target(*next, target.depth, target.context, target.redirects + 1))
        Logger::info("Redirect: " + target.url + " -> " + *next);
    else
        Logger::info("Redirect not followed: " + target.url + " -> " + *next);
}

void Crawler::handle_success(const CrawlTarget& target, Response res) {
    record_resource(target);

    std::string base_url = !res.effective_url.empty() ? res.effective_url : target.url;

    Extraction extraction;
    try {
        extraction = Extractor::extract(res.body, res.content_type, base_url);
    } catch (const std::exception& e) {
        Logger::error("Extraction failed for " + target.url + ": " + std::string(e.what()));
        return;
    }

    for (const auto& name : extraction.functions) {
        if (results_.add_function(name))
            emit(CrawlEvent::function(name, target.url));
    }

    admit_links(extraction, target.depth);
}

void Crawler::record_resource(const CrawlTarget& target) {
    std::string reported = Url::strip_query(target.url);
    switch (target.kind) {
        case ResourceKind::HtmlPage:
            if (results_.add_page(reported))
                emit(CrawlEvent::page(reported, target.depth));
            break;
        case ResourceKind::BackendEndpoint:
            if (results_.add_endpoint(reported))
                emit(CrawlEvent::endpoint(reported, target.depth));
            break;
        default: break;
    }
}

void Crawler::admit_links(const Extraction& extraction, int depth) {
    for (const auto& link : extraction.links) {
        add_target(link.url, depth + 1, link.context);
    }
}

}  // namespace Engine
}  // namespace Webscout

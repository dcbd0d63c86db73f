#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../../utils/text/extractor.hpp"
#include "../../utils/url/classifier.hpp"
#include "../events/event.hpp"
#include "../frontier/visited_set.hpp"
#include "../results/result_set.hpp"

#ifndef CPPCHECK
class CrawlerTest_AddTargetClaimsOnce_Test;
class CrawlerTest_AddTargetDropsOutOfScope_Test;
class CrawlerTest_PartialFailure_Test;
#endif

namespace Webscout {
namespace Engine {

using namespace Webscout::Core;
using namespace Webscout::Network::Http;
using namespace Webscout::Utils;

struct CrawlerConfig {
    int                       max_depth   = Constants::DEFAULT_DEPTH;
    int                       threads     = Constants::DEFAULT_THREADS;
    int                       concurrency = Constants::DEFAULT_CONCURRENCY;
    std::chrono::milliseconds request_timeout{Constants::DEFAULT_REQUEST_TIMEOUT_MS};
    std::chrono::seconds      crawl_timeout{Constants::DEFAULT_CRAWL_TIMEOUT_S};
    std::size_t               max_body_bytes = Constants::DEFAULT_MAX_BODY_BYTES;
    int                       max_redirects  = Constants::DEFAULT_MAX_REDIRECTS;
    std::string               user_agent     = Constants::USER_AGENT;
    bool                      handle_signals = true;
};

struct CrawlTarget {
    std::string  url;
    int          depth = 0;
    ResourceKind kind  = ResourceKind::HtmlPage;
    LinkContext  context   = LinkContext::Navigation;
    int          redirects = 0;  // hops that led here from the linked URL
};

enum class CrawlState { Idle, Running, Draining, Done };

const char* to_string(CrawlState state);

using ClientFactory = std::function<std::unique_ptr<HttpClient>()>;

/**
 * Frontier scheduler. Owns the frontier, the visited set and the results;
 * `concurrency` worker coroutines on `threads` IO threads pull targets,
 * fetch, extract and fold discoveries back in. start() blocks until the
 * crawl is Done, either drained or cancelled through stop(), a signal or
 * the crawl timeout.
 */
class Crawler {
#ifndef CPPCHECK
    friend class ::CrawlerTest_AddTargetClaimsOnce_Test;
    friend class ::CrawlerTest_AddTargetDropsOutOfScope_Test;
    friend class ::CrawlerTest_PartialFailure_Test;
#endif

public:
    explicit Crawler(const CrawlerConfig& config, ClientFactory factory = {});
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    void set_event_sink(EventSink sink);

    // Throws std::invalid_argument for a seed that does not normalize.
    void start(const std::string& seed_url);
    void stop();

    CrawlState         state() const;
    ResultSnapshot     results() const;
    StatsSnapshot      stats() const;
    const std::string& seed() const;
    bool               seed_unreachable() const;
    int                max_depth() const;

#ifdef CPPCHECK
public:
#else
private:
#endif
    CrawlerConfig config_;
    ClientFactory client_factory_;
    EventSink     sink_;

    std::string                 seed_;
    std::unique_ptr<Classifier> classifier_;

    std::deque<CrawlTarget> frontier_;
    mutable std::mutex      queue_mutex_;
    VisitedSet              visited_;
    ResultSet               results_;
    CrawlStats              stats_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                              work_guard_;
    std::vector<std::thread>  io_threads_;
    boost::asio::signal_set   signals_{ioc_};
    boost::asio::steady_timer crawl_timer_{ioc_};

    std::atomic<int>        active_workers_{0};
    std::atomic<int>        live_workers_{0};
    std::atomic<bool>       cancelled_{false};
    std::atomic<bool>       done_{false};
    std::atomic<bool>       seed_unreachable_{false};
    std::atomic<CrawlState> state_{CrawlState::Idle};
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;
    std::atomic<bool>       is_shutdown_{false};

    void init_io_services();
    void init_signals();
    void init_crawl_timer();
    void spawn_workers();
    void await_completion();
    void trigger_done();
    void shutdown();

    std::unique_ptr<HttpClient> create_client();
    std::optional<CrawlTarget>  fetch_next_task();
    bool                        should_stop_worker();

    boost::asio::awaitable<void> worker_loop();
    boost::asio::awaitable<void> process_target(HttpClient& client, CrawlTarget target);

    void handle_failure(const CrawlTarget& target, const Response& res);
    void handle_redirect(const CrawlTarget& target, Response res);
    void handle_success(const CrawlTarget& target, Response res);
    void record_resource(const CrawlTarget& target);
    void admit_links(const Utils::Text::Extraction& extraction, int depth);
    bool add_target(const std::string& url, int depth, LinkContext context, int redirects = 0);

    void emit(const CrawlEvent& event);
};

}  // namespace Engine
}  // namespace Webscout

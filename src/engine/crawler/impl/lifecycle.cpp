#include <csignal>
#include <stdexcept>
#include "../../../core/logger/logger.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawler.hpp"

namespace Webscout {
namespace Engine {

Crawler::~Crawler() {
    shutdown();
}

void Crawler::start(const std::string& seed_url) {
    if (state_ != CrawlState::Idle)
        throw std::logic_error("Crawler: start() may only be called once");

    auto normalized = Url::normalize(seed_url);
    if (!normalized)
        throw std::invalid_argument("Invalid seed URL: " + seed_url);

    seed_       = *normalized;
    classifier_ = std::make_unique<Classifier>(seed_);
    state_      = CrawlState::Running;

    Logger::info("Crawler: Starting for " + seed_);
    Logger::info("Crawler: Scope set to " + classifier_->scope());

    // The seed is fetched whatever its extension says.
    ResourceKind kind = classifier_->classify(seed_, LinkContext::Navigation);
    if (!is_traversable(kind))
        kind = ResourceKind::HtmlPage;
    visited_.try_claim(seed_);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        frontier_.push_back({seed_, 0, kind});
    }

    init_io_services();
    init_signals();
    init_crawl_timer();
    spawn_workers();
    Logger::info("Crawler: Workers spawned, awaiting completion...");
    await_completion();
    shutdown();

    StatsSnapshot summary = stats();
    state_                = CrawlState::Done;
    emit(CrawlEvent::done(summary));
}

void Crawler::stop() {
    if (cancelled_.exchange(true))
        return;
    Logger::warn("Crawler: Stop requested, draining in-flight requests...");
    if (state_ == CrawlState::Running)
        state_ = CrawlState::Draining;
}

void Crawler::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < config_.threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::info("Started " + std::to_string(config_.threads) + " IO threads, "
                 + std::to_string(config_.concurrency) + " workers.");
}

void Crawler::init_signals() {
    if (!config_.handle_signals)
        return;

    signals_.clear();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number)
                         + " received. Triggering stop...");
            stop();
        }
    });
}

void Crawler::init_crawl_timer() {
    if (config_.crawl_timeout.count() <= 0)
        return;

    crawl_timer_.expires_after(config_.crawl_timeout);
    crawl_timer_.async_wait([this](const boost::system::error_code& error) {
        if (!error) {
            Logger::warn("Crawl timeout of " + std::to_string(config_.crawl_timeout.count())
                         + "s reached.");
            stop();
        }
    });
}

void Crawler::spawn_workers() {
    live_workers_ = config_.concurrency;
    for (int i = 0; i < config_.concurrency; ++i) {
        boost::asio::co_spawn(ioc_, worker_loop(), boost::asio::detached);
    }
}

void Crawler::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Crawler::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    if (state_ == CrawlState::Running)
        state_ = CrawlState::Draining;
    done_cv_.notify_all();
}

void Crawler::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    done_ = true;
    if (io_threads_.empty())
        return;

    Logger::info("Shutting down resources...");

    boost::system::error_code ec;
    signals_.cancel(ec);
    crawl_timer_.cancel();

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();
}

}  // namespace Engine
}  // namespace Webscout

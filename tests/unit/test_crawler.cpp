#include <utility>
#include <boost/asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#ifndef CPPCHECK
#include <gtest/gtest.h>
#else
#define TEST(a, b) void a##_##b()
#define TEST_F(a, b) void a##_##b()
#define EXPECT_EQ(a, b)
#define EXPECT_TRUE(a)
#define EXPECT_FALSE(a)
namespace testing { class Test {}; }
#endif
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/crawler/crawler.hpp"

using namespace Webscout::Engine;
using namespace Webscout::Core;
using Webscout::Response;
using Webscout::Network::Http::ErrorType;
using Webscout::Network::Http::HttpClient;

namespace {

const std::string SITE = "http://app.test";

struct FakePage {
    long                      status       = 200;
    std::string               content_type = "text/html";
    std::string               body;
    ErrorType                 error = ErrorType::None;
    std::chrono::milliseconds delay{0};
    std::string               location;
    std::string               effective_url;  // as if the client followed a redirect
};

// Scripted site shared by every worker's client. Unknown URLs answer 404.
class FakeSite {
public:
    void page(const std::string& path, FakePage page) {
        std::lock_guard<std::mutex> lock(mutex_);
        pages_[SITE + path] = std::move(page);
    }

    void html(const std::string& path, const std::string& body) {
        page(path, FakePage{.body = body});
    }

    // Fallback for URLs without a scripted page.
    void generator(std::function<FakePage(const std::string&)> gen) {
        std::lock_guard<std::mutex> lock(mutex_);
        generator_ = std::move(gen);
    }

    FakePage lookup(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        hits_[url]++;
        auto it = pages_.find(url);
        if (it != pages_.end())
            return it->second;
        if (generator_)
            return generator_(url);
        return FakePage{.status = 404, .body = "not found"};
    }

    int hits(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = hits_.find(SITE + path);
        return it == hits_.end() ? 0 : it->second;
    }

    int total_hits() {
        std::lock_guard<std::mutex> lock(mutex_);
        int                         total = 0;
        for (const auto& [url, count] : hits_)
            total += count;
        return total;
    }

private:
    std::mutex                                  mutex_;
    std::map<std::string, FakePage>             pages_;
    std::map<std::string, int>                  hits_;
    std::function<FakePage(const std::string&)> generator_;
};

class FakeClient : public HttpClient {
public:
    explicit FakeClient(std::shared_ptr<FakeSite> site) : site_(std::move(site)) {
    }

    boost::asio::awaitable<Response> get(const std::string& url) override {
        FakePage page = site_->lookup(url);
        if (page.delay.count() > 0) {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(page.delay);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }

        Response res;
        res.effective_url = page.effective_url.empty() ? url : page.effective_url;
        res.status_code   = page.error == ErrorType::None ? page.status : 0;
        if (res.status_code / 100 == 3)
            res.location = page.location;
        res.content_type  = page.content_type;
        res.body          = page.body;
        res.success       = page.error == ErrorType::None && page.status >= 200 && page.status < 300;
        if (page.error != ErrorType::None) {
            res.error_type = page.error;
            res.error      = Webscout::Network::Http::to_string(page.error);
        }
        else if (!res.success) {
            res.error_type = ErrorType::HttpStatus;
            res.error      = "HTTP " + std::to_string(page.status);
        }
        co_return res;
    }

private:
    std::shared_ptr<FakeSite> site_;
};

class EventLog {
public:
    EventSink sink() {
        return [this](const CrawlEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        };
    }

    std::vector<CrawlEvent> of(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<CrawlEvent>     out;
        for (const auto& e : events_)
            if (e.type == type)
                out.push_back(e);
        return out;
    }

    std::vector<CrawlEvent> all() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    std::mutex              mutex_;
    std::vector<CrawlEvent> events_;
};

}  // namespace

class CrawlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(LOG_ERROR);
        site_ = std::make_shared<FakeSite>();
    }

    void TearDown() override {
        Logger::set_level(LOG_ALL);
    }

    CrawlerConfig get_default_config() {
        CrawlerConfig cfg;
        cfg.max_depth      = 3;
        cfg.threads        = 2;
        cfg.concurrency    = 4;
        cfg.handle_signals = false;
        return cfg;
    }

    ClientFactory factory() {
        auto site = site_;
        return [site]() { return std::make_unique<FakeClient>(site); };
    }

    std::shared_ptr<FakeSite> site_;
    EventLog                  log_;
};

TEST_F(CrawlerTest, ConfigMapping) {
    auto cfg      = get_default_config();
    cfg.max_depth = 5;
    Crawler crawler(cfg, factory());
    EXPECT_EQ(crawler.max_depth(), 5);
    EXPECT_EQ(crawler.state(), CrawlState::Idle);
}

TEST_F(CrawlerTest, AddTargetClaimsOnce) {
    Crawler crawler(get_default_config(), factory());
    crawler.seed_       = SITE + "/";
    crawler.classifier_ = std::make_unique<Webscout::Utils::Classifier>(crawler.seed_);

    EXPECT_TRUE(crawler.add_target(SITE + "/a", 1, Webscout::Utils::LinkContext::Navigation));
    EXPECT_FALSE(crawler.add_target(SITE + "/a#top", 2, Webscout::Utils::LinkContext::Navigation));
    EXPECT_FALSE(crawler.add_target(SITE + "/./a", 1, Webscout::Utils::LinkContext::FormAction));
    ASSERT_EQ(crawler.frontier_.size(), 1u);
    EXPECT_EQ(crawler.frontier_.front().depth, 1);
    EXPECT_EQ(crawler.frontier_.front().kind, Webscout::Utils::ResourceKind::HtmlPage);
}

TEST_F(CrawlerTest, AddTargetDropsOutOfScope) {
    Crawler crawler(get_default_config(), factory());
    crawler.seed_       = SITE + "/";
    crawler.classifier_ = std::make_unique<Webscout::Utils::Classifier>(crawler.seed_);

    using Webscout::Utils::LinkContext;
    EXPECT_FALSE(crawler.add_target("http://other.test/a", 1, LinkContext::Navigation));
    EXPECT_FALSE(crawler.add_target(SITE + "/logo.png", 1, LinkContext::Navigation));
    EXPECT_FALSE(crawler.add_target("mailto:someone@app.test", 1, LinkContext::Navigation));
    EXPECT_FALSE(crawler.add_target("javascript:void(0)", 1, LinkContext::Navigation));
    EXPECT_TRUE(crawler.frontier_.empty());
    EXPECT_EQ(crawler.visited_.size(), 0u);
}

class LinearSiteTest : public CrawlerTest {
protected:
    void SetUp() override {
        CrawlerTest::SetUp();
        site_->html("/", "<html><body><a href='/a'>A</a><a href='/b'>B</a></body></html>");
        site_->html("/a",
                    "<html><body><form action='/api/save' method='post'>"
                    "<input name='q'></form></body></html>");
        site_->html("/b", "<html><body>end</body></html>");
        site_->page("/api/save", FakePage{.content_type = "application/json", .body = "{}"});
    }
};

TEST_F(LinearSiteTest, FormEndpointWithinDepth) {
    auto cfg      = get_default_config();
    cfg.max_depth = 2;
    Crawler crawler(cfg, factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    auto results = crawler.results();
    EXPECT_EQ(results.html_pages,
              (std::set<std::string>{SITE + "/", SITE + "/a", SITE + "/b"}));
    EXPECT_EQ(results.backend_endpoints, (std::set<std::string>{SITE + "/api/save"}));
    EXPECT_EQ(crawler.state(), CrawlState::Done);

    auto stats = crawler.stats();
    EXPECT_EQ(stats.fetched, 4);
    EXPECT_EQ(stats.failed, 0);
    EXPECT_EQ(stats.max_depth_seen, 2);
    EXPECT_EQ(log_.of(EventType::DiscoveredPage).size(), 3u);
    EXPECT_EQ(log_.of(EventType::DiscoveredEndpoint).size(), 1u);
    EXPECT_TRUE(log_.of(EventType::DepthLimitReached).empty());
}

TEST_F(LinearSiteTest, FormEndpointPastDepth) {
    auto cfg      = get_default_config();
    cfg.max_depth = 1;
    Crawler crawler(cfg, factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    auto results = crawler.results();
    EXPECT_EQ(results.html_pages,
              (std::set<std::string>{SITE + "/", SITE + "/a", SITE + "/b"}));
    EXPECT_TRUE(results.backend_endpoints.empty());
    EXPECT_EQ(site_->hits("/api/save"), 0);

    auto limited = log_.of(EventType::DepthLimitReached);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].url, SITE + "/api/save");
    EXPECT_EQ(limited[0].depth, 2);
    EXPECT_EQ(crawler.stats().depth_limited, 1);
}

TEST_F(CrawlerTest, DepthExhaustionOnLinkChain) {
    site_->html("/", "<a href='/a'>A</a>");
    site_->html("/a", "<a href='/b'>B</a>");
    site_->html("/b", "<a href='/c'>C</a>");

    auto cfg      = get_default_config();
    cfg.max_depth = 1;
    Crawler crawler(cfg, factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/", SITE + "/a"}));
    EXPECT_EQ(site_->hits("/b"), 0);

    auto limited = log_.of(EventType::DepthLimitReached);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].url, SITE + "/b");
    EXPECT_EQ(limited[0].depth, 2);
}

TEST_F(CrawlerTest, DepthZeroFetchesOnlySeed) {
    site_->html("/", "<a href='/a'>A</a><a href='/b'>B</a>");

    auto cfg      = get_default_config();
    cfg.max_depth = 0;
    Crawler crawler(cfg, factory());
    crawler.start(SITE + "/");

    EXPECT_EQ(site_->total_hits(), 1);
    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/"}));
}

TEST_F(CrawlerTest, DuplicatePathsFetchedOnce) {
    site_->html("/", "<a href='/a'>A</a><a href='/b'>B</a><a href='/#frag'>self</a>");
    site_->html("/a", "<a href='/c'>C</a><a href='c'>C again</a>");
    site_->html("/b", "<a href='/c'>C</a><a href='./c'>C</a><a href='HTTP://APP.TEST/c'>C</a>");
    site_->html("/c", "<p>leaf</p>");

    Crawler crawler(get_default_config(), factory());
    crawler.start(SITE + "/");

    EXPECT_EQ(site_->hits("/c"), 1);
    EXPECT_EQ(site_->hits("/"), 1);
    EXPECT_EQ(crawler.results().html_pages.size(), 4u);
    EXPECT_EQ(crawler.stats().visited, 4u);
}

TEST_F(CrawlerTest, RedirectOutOfScopeNotFollowed) {
    site_->html("/", "<a href='/go'>Go</a>");
    site_->page("/go", FakePage{.status = 302, .location = "http://other.test/offsite"});
    site_->generator([](const std::string&) {
        return FakePage{.body = "<a href='http://app.test/steered'>x</a>"};
    });

    Crawler crawler(get_default_config(), factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_EQ(site_->total_hits(), 2);
    EXPECT_EQ(site_->hits("/steered"), 0);
    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/"}));
    EXPECT_TRUE(log_.of(EventType::FetchFailed).empty());
}

TEST_F(CrawlerTest, RedirectToLinkedUrlFetchedOnce) {
    site_->html("/", "<a href='/a'>A</a><a href='/b'>B</a>");
    site_->page("/a", FakePage{.status = 301, .location = "/b"});
    site_->html("/b", "<p>target</p>");

    Crawler crawler(get_default_config(), factory());
    crawler.start(SITE + "/");

    EXPECT_EQ(site_->hits("/a"), 1);
    EXPECT_EQ(site_->hits("/b"), 1);
    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/", SITE + "/b"}));
}

TEST_F(CrawlerTest, RedirectKeepsDepth) {
    site_->html("/", "<a href='/old'>Old</a>");
    site_->page("/old", FakePage{.status = 301, .location = SITE + "/new"});
    site_->html("/new", "<a href='/deeper'>Deeper</a>");

    auto cfg      = get_default_config();
    cfg.max_depth = 1;
    Crawler crawler(cfg, factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/", SITE + "/new"}));
    EXPECT_EQ(site_->hits("/deeper"), 0);

    auto limited = log_.of(EventType::DepthLimitReached);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].url, SITE + "/deeper");
    EXPECT_EQ(limited[0].depth, 2);
}

TEST_F(CrawlerTest, RedirectChainLimit) {
    site_->html("/", "<a href='/r0'>R</a>");
    site_->page("/r0", FakePage{.status = 302, .location = "/r1"});
    site_->page("/r1", FakePage{.status = 302, .location = "/r2"});
    site_->page("/r2", FakePage{.status = 302, .location = "/r3"});
    site_->html("/r3", "<p>end</p>");

    auto cfg          = get_default_config();
    cfg.max_redirects = 2;
    Crawler crawler(cfg, factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_EQ(site_->hits("/r2"), 1);
    EXPECT_EQ(site_->hits("/r3"), 0);
    EXPECT_EQ(crawler.stats().failed, 1);

    auto failed = log_.of(EventType::FetchFailed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].url, SITE + "/r2");
}

TEST_F(CrawlerTest, OffScopeResponseIsRejected) {
    site_->html("/", "<a href='/moved'>Moved</a>");
    site_->page("/moved",
                FakePage{.body          = "<a href='/steered'>x</a>",
                         .effective_url = "http://other.test/landing"});

    Crawler crawler(get_default_config(), factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/"}));
    EXPECT_EQ(site_->hits("/steered"), 0);
    EXPECT_EQ(crawler.stats().failed, 1);
    EXPECT_FALSE(crawler.seed_unreachable());
}

TEST_F(CrawlerTest, FunctionExtraction) {
    site_->html("/",
                "<html><head><script src='/app.js'></script>"
                "<script>function validateForm() { return true; }</script></head>"
                "<body><a href='/shop'>Shop</a></body></html>");
    site_->page("/app.js",
                FakePage{.content_type = "application/javascript",
                         .body         = "const initCart = () => { fetch('/api/cart'); };"});
    site_->html("/shop", "<script>function validateForm() {}</script>");
    site_->page("/api/cart", FakePage{.content_type = "application/json", .body = "{}"});

    Crawler crawler(get_default_config(), factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    auto results = crawler.results();
    EXPECT_EQ(results.functions, (std::set<std::string>{"initCart", "validateForm"}));
    EXPECT_EQ(results.backend_endpoints, (std::set<std::string>{SITE + "/api/cart"}));
    EXPECT_EQ(results.html_pages.count(SITE + "/app.js"), 0u);
    EXPECT_EQ(site_->hits("/app.js"), 1);

    // Repeated names are announced once.
    EXPECT_EQ(log_.of(EventType::DiscoveredFunction).size(), 2u);
}

TEST_F(CrawlerTest, FormActionIsEndpoint) {
    site_->html("/",
                "<a href='/about.php'>About</a>"
                "<form action='/login.php' method='post'><input name='u'></form>");
    site_->html("/about.php", "<p>about</p>");
    site_->html("/login.php", "<p>login</p>");

    Crawler crawler(get_default_config(), factory());
    crawler.start(SITE + "/");

    auto results = crawler.results();
    EXPECT_EQ(results.html_pages.count(SITE + "/about.php"), 1u);
    EXPECT_EQ(results.backend_endpoints, (std::set<std::string>{SITE + "/login.php"}));
}

TEST_F(CrawlerTest, QueryVariantsFetchedButReportedOnce) {
    site_->html("/", "<a href='/item?id=1'>1</a><a href='/item?id=2'>2</a>");
    site_->html("/item?id=1", "<p>1</p>");
    site_->html("/item?id=2", "<p>2</p>");

    Crawler crawler(get_default_config(), factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_EQ(site_->hits("/item?id=1"), 1);
    EXPECT_EQ(site_->hits("/item?id=2"), 1);
    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/", SITE + "/item"}));
    EXPECT_EQ(log_.of(EventType::DiscoveredPage).size(), 2u);
}

TEST_F(CrawlerTest, ExternalLinksNeverFetched) {
    site_->html("/",
                "<a href='http://other.test/x'>x</a><a href='//cdn.test/lib'>cdn</a>"
                "<a href='http://app.test:8080/'>port</a><img src='/logo.png'>");

    Crawler crawler(get_default_config(), factory());
    crawler.start(SITE + "/");

    EXPECT_EQ(site_->total_hits(), 1);
    EXPECT_EQ(crawler.results().html_pages.size(), 1u);
}

TEST_F(CrawlerTest, PartialFailure) {
    site_->html("/", "<a href='/ok'>ok</a><a href='/broken'>b</a><a href='/slow'>s</a>");
    site_->html("/ok", "<p>fine</p>");
    site_->page("/broken", FakePage{.status = 500, .body = "oops"});
    site_->page("/slow", FakePage{.error = ErrorType::Timeout});

    Crawler crawler(get_default_config(), factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_EQ(crawler.results().html_pages, (std::set<std::string>{SITE + "/", SITE + "/ok"}));
    EXPECT_FALSE(crawler.seed_unreachable());

    auto failures = log_.of(EventType::FetchFailed);
    ASSERT_EQ(failures.size(), 2u);
    for (const auto& f : failures) {
        if (f.url == SITE + "/broken") {
            EXPECT_EQ(f.error, ErrorType::HttpStatus);
            EXPECT_EQ(f.status, 500);
        }
        else {
            EXPECT_EQ(f.url, SITE + "/slow");
            EXPECT_EQ(f.error, ErrorType::Timeout);
        }
    }

    auto stats = crawler.stats();
    EXPECT_EQ(stats.failed, 2);
    EXPECT_EQ(stats.fetched, 2);
    EXPECT_EQ(crawler.stats_.failures_of(ErrorType::HttpStatus), 1);
    EXPECT_EQ(crawler.stats_.failures_of(ErrorType::Timeout), 1);
}

TEST_F(CrawlerTest, InvalidSeedThrows) {
    Crawler crawler(get_default_config(), factory());
    EXPECT_THROW(crawler.start("ftp://app.test/"), std::invalid_argument);
    EXPECT_EQ(site_->total_hits(), 0);

    Crawler other(get_default_config(), factory());
    EXPECT_THROW(other.start("http://"), std::invalid_argument);
}

TEST_F(CrawlerTest, SeedUnreachable) {
    site_->page("/", FakePage{.error = ErrorType::ConnectionRefused});

    Crawler crawler(get_default_config(), factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    EXPECT_TRUE(crawler.seed_unreachable());
    EXPECT_TRUE(crawler.results().html_pages.empty());
    EXPECT_EQ(log_.of(EventType::CrawlDone).size(), 1u);
}

TEST_F(CrawlerTest, CrawlDoneIsLastEvent) {
    site_->html("/", "<a href='/a'>A</a>");
    site_->html("/a", "<script>function go() {}</script>");

    Crawler crawler(get_default_config(), factory());
    crawler.set_event_sink(log_.sink());
    crawler.start(SITE + "/");

    auto events = log_.all();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::CrawlDone);
    EXPECT_EQ(events.back().stats.total_html, 2u);
    EXPECT_EQ(events.back().stats.total_functions, 1u);
    EXPECT_EQ(log_.of(EventType::CrawlDone).size(), 1u);
}

TEST_F(CrawlerTest, CancellationKeepsPartialResults) {
    // Endless chain: /n/0 -> /n/1 -> ...
    site_->generator([](const std::string& url) {
        auto        pos  = url.rfind('/');
        int         next = std::stoi(url.substr(pos + 1)) + 1;
        std::string link = "<a href='/n/" + std::to_string(next) + "'>next</a>";
        return FakePage{.body = link, .delay = std::chrono::milliseconds(20)};
    });

    auto cfg      = get_default_config();
    cfg.max_depth = 100000;
    Crawler crawler(cfg, factory());
    crawler.set_event_sink(log_.sink());

    std::thread runner([&]() { crawler.start(SITE + "/n/0"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    crawler.stop();
    runner.join();

    EXPECT_EQ(crawler.state(), CrawlState::Done);
    auto pages = crawler.results().html_pages;
    EXPECT_FALSE(pages.empty());
    EXPECT_LT(pages.size(), 1000u);
    EXPECT_EQ(log_.all().back().type, EventType::CrawlDone);
}

TEST_F(CrawlerTest, CrawlTimeoutCancels) {
    site_->generator([](const std::string& url) {
        auto        pos  = url.rfind('/');
        int         next = std::stoi(url.substr(pos + 1)) + 1;
        std::string link = "<a href='/n/" + std::to_string(next) + "'>next</a>";
        return FakePage{.body = link, .delay = std::chrono::milliseconds(20)};
    });

    auto cfg          = get_default_config();
    cfg.max_depth     = 100000;
    cfg.crawl_timeout = std::chrono::seconds(1);
    Crawler crawler(cfg, factory());

    auto begin = std::chrono::steady_clock::now();
    crawler.start(SITE + "/n/0");
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(crawler.state(), CrawlState::Done);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(crawler.results().html_pages.empty());
}

TEST_F(CrawlerTest, StartTwiceIsRejected) {
    site_->html("/", "<p>only</p>");
    Crawler crawler(get_default_config(), factory());
    crawler.start(SITE + "/");
    EXPECT_THROW(crawler.start(SITE + "/"), std::logic_error);
}

#include <exception>
#include <stdexcept>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "engine/events/event_channel.hpp"
#include "engine/report/report.hpp"
#include "engine/reporter/console_reporter.hpp"
#include "storage/disk_storage.hpp"

namespace {

constexpr int EXIT_SETUP_FAILURE  = 1;
constexpr int EXIT_REPORT_FAILURE = 2;

Webscout::Engine::CrawlerConfig to_crawler_config(const Webscout::Core::Config& config) {
    Webscout::Engine::CrawlerConfig crawler_config;
    crawler_config.max_depth       = config.depth;
    crawler_config.threads         = config.threads;
    crawler_config.concurrency     = config.concurrency;
    crawler_config.request_timeout = std::chrono::milliseconds(config.request_timeout);
    crawler_config.crawl_timeout   = std::chrono::seconds(config.crawl_timeout);
    crawler_config.max_body_bytes  = config.max_body_bytes;
    crawler_config.max_redirects   = config.max_redirects;
    crawler_config.user_agent      = config.user_agent;
    return crawler_config;
}

bool write_report(const Webscout::Core::Config& config, const Webscout::Engine::Crawler& crawler) {
    using Webscout::Engine::Report;

    auto json = Report::build(crawler.results(), crawler.stats(), crawler.seed(), config.depth);
    Webscout::Storage::DiskStorage storage(config.output_dir);
    return storage.save(Report::file_name(crawler.seed()), json.dump(2) + "\n");
}

int run_crawler(const Webscout::Core::Config& config) {
    using namespace Webscout::Engine;
    using Webscout::Core::Logger;

    EventChannel    channel(config.event_buffer);
    ConsoleReporter reporter(channel);
    Crawler         crawler(to_crawler_config(config));
    crawler.set_event_sink(channel.sink());

    reporter.start();
    try {
        crawler.start(config.url);
    } catch (const std::invalid_argument& e) {
        channel.close();
        reporter.join();
        Logger::error(e.what());
        return EXIT_SETUP_FAILURE;
    }
    channel.close();
    reporter.join();

    if (crawler.seed_unreachable()) {
        Logger::error("Seed unreachable: " + crawler.seed());
        return EXIT_SETUP_FAILURE;
    }

    if (!write_report(config, crawler)) {
        Logger::error("Could not write report to " + config.output_dir);
        return EXIT_REPORT_FAILURE;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    using Webscout::Core::Logger;

    Webscout::Core::Config config;
    try {
        config = Webscout::Core::Config::parse(argc, argv);
        config.validate();
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return EXIT_SETUP_FAILURE;
    }

    if (config.quiet)
        Logger::set_level(Webscout::Core::LOG_ERROR | Webscout::Core::LOG_SUCCESS);

    return run_crawler(config);
}

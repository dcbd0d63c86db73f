#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "../../utils/text/string_utils.hpp"

namespace Webscout {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["url"])
            config.url = yaml["url"].as<std::string>();
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["max_depth"])
            config.depth = yaml["max_depth"].as<int>();
        if (yaml["concurrency"])
            config.concurrency = yaml["concurrency"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["timeout"])
            config.request_timeout = yaml["timeout"].as<int>();
        if (yaml["crawl_timeout"])
            config.crawl_timeout = yaml["crawl_timeout"].as<int>();
        if (yaml["max_body"])
            config.max_body_bytes = yaml["max_body"].as<std::size_t>();
        if (yaml["max_redirects"])
            config.max_redirects = yaml["max_redirects"].as<int>();
        if (yaml["event_buffer"])
            config.event_buffer = yaml["event_buffer"].as<std::size_t>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["quiet"])
            config.quiet = yaml["quiet"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Webscout - Web application endpoint and function discovery"};

    std::string positional_url;

    app.set_version_flag("--version", Constants::VERSION);

    app.add_option("-u,--url", config.url, "Target URL to scan (e.g. http://example.com)");
    app.add_option("-d,--depth", config.depth, "Maximum crawl depth");
    app.add_option("-c,--concurrency", config.concurrency, "Concurrent fetches");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option(
        "--timeout", config.request_timeout, "Per-request timeout (ms), excluding DNS lookup");
    app.add_option("--crawl-timeout", config.crawl_timeout, "Whole crawl timeout (s, 0 = none)");
    app.add_option("--max-body", config.max_body_bytes, "Maximum response body size (bytes)");
    app.add_option("--max-redirects", config.max_redirects, "Redirect hops followed from a linked URL");
    app.add_option("--event-buffer", config.event_buffer, "Progress events kept for the reporter");
    app.add_option("--user-agent", config.user_agent, "User-Agent header");
    app.add_option("-o,--output", config.output_dir, "Report output directory");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("-q,--quiet", config.quiet, "Only print errors and the summary");
    app.add_option("target", positional_url, "Target URL (alternative to --url)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Command line wins over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (config.url.empty())
        config.url = positional_url;
    config.url = normalize_seed(config.url);

    return config;
}

std::string Config::normalize_seed(const std::string& url) {
    std::string seed = Utils::Text::trim(url);
    if (seed.empty())
        return seed;
    if (seed.find("://") == std::string::npos)
        seed = "http://" + seed;
    return seed;
}

void Config::validate() const {
    if (url.empty())
        throw std::invalid_argument("No target URL provided.");
    if (depth < 0)
        throw std::invalid_argument("Depth must be non-negative.");
    if (concurrency < 1)
        throw std::invalid_argument("Concurrency must be at least 1.");
    if (threads < 1)
        throw std::invalid_argument("Threads must be at least 1.");
    if (request_timeout <= 0)
        throw std::invalid_argument("Timeout must be positive.");
    if (crawl_timeout < 0)
        throw std::invalid_argument("Crawl timeout must be non-negative.");
    if (max_redirects < 0)
        throw std::invalid_argument("Max redirects must be non-negative.");
    if (event_buffer == 0)
        throw std::invalid_argument("Event buffer must be at least 1.");
}

}  // namespace Core
}  // namespace Webscout

#pragma once
#include <cstddef>
#include <string>

#include "../types/constants.hpp"

namespace Webscout {
namespace Core {

struct Config {
    std::string url;
    int         depth            = Constants::DEFAULT_DEPTH;
    int         concurrency      = Constants::DEFAULT_CONCURRENCY;
    int         threads          = Constants::DEFAULT_THREADS;
    int         request_timeout  = Constants::DEFAULT_REQUEST_TIMEOUT_MS;  // milliseconds
    int         crawl_timeout    = Constants::DEFAULT_CRAWL_TIMEOUT_S;     // seconds
    std::size_t max_body_bytes   = Constants::DEFAULT_MAX_BODY_BYTES;
    int         max_redirects    = Constants::DEFAULT_MAX_REDIRECTS;
    std::size_t event_buffer     = Constants::DEFAULT_EVENT_BUFFER;
    std::string user_agent       = Constants::USER_AGENT;
    std::string output_dir       = Constants::DEFAULT_OUTPUT_DIR;
    std::string config_path;
    bool        quiet = false;

    static Config parse(int argc, char* argv[]);

    // Prepends http:// to a scheme-less seed.
    static std::string normalize_seed(const std::string& url);

    // Throws std::invalid_argument on out-of-range values.
    void validate() const;
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Webscout

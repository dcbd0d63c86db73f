#pragma once
#include <optional>
#include <string>

namespace Webscout {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    /**
     * Canonical absolute form of `raw` resolved against `base`: fragment
     * stripped, scheme and host lower-cased, default port removed, dot
     * segments collapsed. Only http and https survive; anything else, or a
     * URL without a usable host, yields std::nullopt.
     */
    static std::optional<std::string> normalize(const std::string& raw,
                                                const std::string& base = "");

    // host[:port] of a normalized URL, port omitted when default.
    static std::string authority(const std::string& url);
    static bool        is_same_domain(const std::string& url1, const std::string& url2);
    static std::string strip_query(const std::string& url);
    static std::string to_report_name(const std::string& url);
    static std::string remove_dot_segments(const std::string& path);
};

}  // namespace Utils
}  // namespace Webscout

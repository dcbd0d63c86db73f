#pragma once
#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

namespace Webscout {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS     = 2;  // IO Threads
    static constexpr int         DEFAULT_CONCURRENCY = 8;  // Fetch coroutines
    static constexpr int         DEFAULT_DEPTH       = 3;
    static constexpr const char* DEFAULT_OUTPUT_DIR  = ".";
    static constexpr const char* VERSION             = "0.1.0";

    static constexpr int         DEFAULT_REQUEST_TIMEOUT_MS = 10000;
    static constexpr int         DEFAULT_CRAWL_TIMEOUT_S    = 0;  // 0 = none
    static constexpr std::size_t DEFAULT_MAX_BODY_BYTES     = 5 * 1024 * 1024;
    static constexpr int         DEFAULT_MAX_REDIRECTS      = 5;
    static constexpr std::size_t DEFAULT_EVENT_BUFFER       = 1024;
    static constexpr const char* USER_AGENT                 = "Webscout/0.1";

    static constexpr const char* REPORT_SUFFIX = "_security_scan.json";
};

// Extensions that never lead to a page or an endpoint.
inline const std::vector<std::string>& get_static_extensions() {
    static const std::vector<std::string> extensions = {
        // images
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg", ".ico", ".tiff", ".avif",
        // styles & fonts
        ".css", ".woff", ".woff2", ".ttf", ".otf", ".eot",
        // media
        ".mp3", ".mp4", ".webm", ".ogg", ".wav", ".avi", ".mov",
        // documents & archives
        ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".csv", ".txt",
        ".zip", ".tar", ".gz", ".rar", ".7z", ".map"};
    return extensions;
}

inline const std::vector<std::string>& get_script_extensions() {
    static const std::vector<std::string> extensions = {".js", ".mjs"};
    return extensions;
}

// Server-side scripts: a page when navigated to, an endpoint when submitted to.
inline const std::vector<std::string>& get_server_script_extensions() {
    static const std::vector<std::string> extensions = {
        ".php", ".asp", ".aspx", ".jsp", ".jspx", ".cfm", ".pl"};
    return extensions;
}

inline const std::vector<std::string>& get_markup_extensions() {
    static const std::vector<std::string> extensions = {".html", ".htm", ".shtml", ".xhtml"};
    return extensions;
}

inline const std::vector<std::string>& get_backend_extensions() {
    static const std::vector<std::string> extensions = {
        ".json", ".xml", ".ashx", ".asmx", ".do", ".action", ".cgi", ".svc"};
    return extensions;
}

inline const std::vector<std::string>& get_api_segments() {
    static const std::vector<std::string> segments = {
        "/api/", "/rest/", "/ws/", "/graphql", "/service", "/rpc/"};
    return segments;
}

inline const std::vector<std::string>& get_api_query_keys() {
    static const std::vector<std::string> keys = {"action=", "method=", "api_key="};
    return keys;
}

inline std::string get_matching_extension(const std::string&              path,
                                          const std::vector<std::string>& extensions) {
    if (path.empty())
        return "";

    std::string path_lower = path;
    for (char& c : path_lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const auto& ext : extensions) {
        if (path_lower.size() >= ext.size()
            && path_lower.compare(path_lower.size() - ext.size(), ext.size(), ext) == 0) {
            return ext;
        }
    }
    return "";
}

inline bool has_extension(const std::string& path, const std::vector<std::string>& extensions) {
    return !get_matching_extension(path, extensions).empty();
}

}  // namespace Core
}  // namespace Webscout

#include "classifier.hpp"
#include "../../core/types/constants.hpp"
#include "../text/string_utils.hpp"
#include "url.hpp"

namespace Webscout {
namespace Utils {

using namespace Webscout::Core;

namespace {

// Extension of the last path segment, lower-cased, with the dot; empty if none.
std::string last_extension(const std::string& path) {
    size_t last_slash = path.find_last_of('/');
    size_t last_dot   = path.find_last_of('.');
    if (last_dot == std::string::npos
        || (last_slash != std::string::npos && last_dot < last_slash))
        return "";
    return Text::to_lower(path.substr(last_dot));
}

bool has_api_marker(const UrlParsed& parsed) {
    std::string path = Text::to_lower(parsed.path);
    for (const auto& segment : get_api_segments()) {
        if (path.find(segment) != std::string::npos)
            return true;
    }

    std::string query = Text::to_lower(parsed.query);
    for (const auto& key : get_api_query_keys()) {
        // Key must start the query or follow a separator.
        for (size_t pos = query.find(key); pos != std::string::npos;
             pos        = query.find(key, pos + 1)) {
            if (pos == 0 || query[pos - 1] == '&')
                return true;
        }
    }
    return false;
}

}  // namespace

const char* to_string(LinkContext context) {
    switch (context) {
        case LinkContext::Navigation: return "navigation";
        case LinkContext::FormAction: return "form-action";
        case LinkContext::ScriptReference: return "script-reference";
    }
    return "unknown";
}

const char* to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::HtmlPage: return "html";
        case ResourceKind::BackendEndpoint: return "backend";
        case ResourceKind::Script: return "script";
        case ResourceKind::External: return "external";
        case ResourceKind::Unsupported: return "unsupported";
        case ResourceKind::Rejected: return "rejected";
    }
    return "unknown";
}

bool is_traversable(ResourceKind kind) {
    return kind == ResourceKind::HtmlPage || kind == ResourceKind::BackendEndpoint
           || kind == ResourceKind::Script;
}

Classifier::Classifier(const std::string& seed) : scope_(Url::authority(seed)) {
}

ResourceKind Classifier::classify(const std::string& normalized_url, LinkContext context) const {
    std::string authority = Url::authority(normalized_url);
    if (authority.empty())
        return ResourceKind::Rejected;
    if (authority != scope_)
        return ResourceKind::External;

    UrlParsed   parsed = Url::parse(normalized_url);
    std::string ext    = last_extension(parsed.path);

    if (!ext.empty() && has_extension(ext, get_static_extensions()))
        return ResourceKind::Unsupported;

    if (!ext.empty() && has_extension(ext, get_script_extensions()))
        return ResourceKind::Script;

    if (has_api_marker(parsed) || (!ext.empty() && has_extension(ext, get_backend_extensions())))
        return ResourceKind::BackendEndpoint;

    bool submitted = context != LinkContext::Navigation;

    if (!ext.empty() && has_extension(ext, get_server_script_extensions()))
        return submitted ? ResourceKind::BackendEndpoint : ResourceKind::HtmlPage;

    if (ext.empty() || has_extension(ext, get_markup_extensions()))
        return submitted ? ResourceKind::BackendEndpoint : ResourceKind::HtmlPage;

    return ResourceKind::Unsupported;
}

}  // namespace Utils
}  // namespace Webscout

#pragma once
#include <string>

namespace Webscout {
namespace Utils {

// How a link was found. Decides page vs endpoint for server-script URLs.
enum class LinkContext { Navigation, FormAction, ScriptReference };

enum class ResourceKind { HtmlPage, BackendEndpoint, Script, External, Unsupported, Rejected };

const char* to_string(LinkContext context);
const char* to_string(ResourceKind kind);

// Resources worth a fetch: pages, endpoints and scripts.
bool is_traversable(ResourceKind kind);

class Classifier {
public:
    // `seed` is any URL of the target application; its authority is the scope.
    explicit Classifier(const std::string& seed);

    ResourceKind classify(const std::string& normalized_url, LinkContext context) const;

    const std::string& scope() const {
        return scope_;
    }

private:
    std::string scope_;
};

}  // namespace Utils
}  // namespace Webscout

#pragma once
#include <string>
#include <vector>

#include "../url/classifier.hpp"

namespace Webscout {
namespace Utils {
namespace Text {

struct ExtractedLink {
    std::string url;  // absolute, resolved against the page (or its <base href>)
    LinkContext context = LinkContext::Navigation;
};

struct Extraction {
    std::vector<ExtractedLink> links;
    std::vector<std::string>   functions;
};

enum class BodyType { Html, JavaScript, Other };

class Extractor {
public:
    static Extraction extract(const std::string& body,
                              const std::string& content_type,
                              const std::string& base_url);

    static BodyType detect(const std::string& content_type, const std::string& body);

    static Extraction extract_html(const std::string& html, const std::string& base_url);
    static Extraction extract_js(const std::string& script, const std::string& base_url);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Webscout

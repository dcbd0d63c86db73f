#include "extractor.hpp"
#include <algorithm>
#include <gumbo.h>
#include <memory>
#include <string_view>

#include "../url/url.hpp"
#include "js_scanner.hpp"
#include "string_utils.hpp"

namespace Webscout {
namespace Utils {
namespace Text {

namespace {

constexpr size_t SNIFF_BYTES = 512;

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const noexcept {
        if (output)
            gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

const char* attribute(GumboNode* node, const char* name) {
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

std::string inline_text(GumboNode* node) {
    std::string text;
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        auto* child = static_cast<GumboNode*>(children->data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA
            || child->type == GUMBO_NODE_WHITESPACE) {
            text += child->v.text.text;
        }
    }
    return text;
}

// JSON-LD, templates and other data blocks are not JavaScript.
bool is_executable_script(GumboNode* node) {
    const char* type = attribute(node, "type");
    if (!type || trim(type).empty())
        return true;
    std::string_view value(type);
    return icontains(value, "javascript") || icontains(value, "ecmascript")
           || icontains(value, "module");
}

class HtmlWalker {
public:
    explicit HtmlWalker(const std::string& base_url) : base_(base_url) {
    }

    void walk(GumboNode* node) {
        if (node->type != GUMBO_NODE_ELEMENT)
            return;

        visit(node);

        const GumboVector* children = &node->v.element.children;
        for (unsigned int i = 0; i < children->length; ++i) {
            walk(static_cast<GumboNode*>(children->data[i]));
        }
    }

    Extraction take() {
        return std::move(result_);
    }

private:
    std::string base_;
    bool        base_seen_ = false;
    Extraction  result_;

    void add(const char* raw, LinkContext context) {
        if (!raw)
            return;
        std::string value = trim(raw);
        if (value.empty() || value[0] == '#')
            return;
        result_.links.push_back({Url::resolve(base_, value), context});
    }

    void visit(GumboNode* node) {
        switch (node->v.element.tag) {
            case GUMBO_TAG_BASE:
                // Only the first <base href> counts.
                if (!base_seen_) {
                    if (const char* href = attribute(node, "href")) {
                        base_      = Url::resolve(base_, trim(href));
                        base_seen_ = true;
                    }
                }
                break;
            case GUMBO_TAG_A:
            case GUMBO_TAG_AREA:
            case GUMBO_TAG_LINK:
                add(attribute(node, "href"), LinkContext::Navigation);
                break;
            case GUMBO_TAG_IFRAME:
            case GUMBO_TAG_FRAME:
            case GUMBO_TAG_IMG:
            case GUMBO_TAG_SOURCE:
            case GUMBO_TAG_VIDEO:
            case GUMBO_TAG_AUDIO:
            case GUMBO_TAG_EMBED:
                add(attribute(node, "src"), LinkContext::Navigation);
                break;
            case GUMBO_TAG_FORM:
                add(attribute(node, "action"), LinkContext::FormAction);
                break;
            case GUMBO_TAG_BUTTON:
            case GUMBO_TAG_INPUT:
                add(attribute(node, "formaction"), LinkContext::FormAction);
                break;
            case GUMBO_TAG_SCRIPT:
                if (const char* src = attribute(node, "src")) {
                    add(src, LinkContext::ScriptReference);
                }
                else if (is_executable_script(node)) {
                    merge(Extractor::extract_js(inline_text(node), base_));
                }
                break;
            default: break;
        }
    }

    void merge(Extraction other) {
        for (auto& link : other.links)
            result_.links.push_back(std::move(link));
        for (auto& fn : other.functions)
            result_.functions.push_back(std::move(fn));
    }
};

bool looks_like_html(const std::string& body) {
    std::string_view head(body.data(), std::min(body.size(), SNIFF_BYTES));
    return icontains(head, "<!doctype html") || icontains(head, "<html")
           || icontains(head, "<body") || icontains(head, "<head");
}

}  // namespace

BodyType Extractor::detect(const std::string& content_type, const std::string& body) {
    if (content_type.empty())
        return looks_like_html(body) ? BodyType::Html : BodyType::Other;
    if (icontains(content_type, "text/html") || icontains(content_type, "application/xhtml"))
        return BodyType::Html;
    if (icontains(content_type, "javascript") || icontains(content_type, "ecmascript"))
        return BodyType::JavaScript;
    return BodyType::Other;
}

Extraction Extractor::extract(const std::string& body,
                              const std::string& content_type,
                              const std::string& base_url) {
    switch (detect(content_type, body)) {
        case BodyType::Html: return extract_html(body, base_url);
        case BodyType::JavaScript: return extract_js(body, base_url);
        case BodyType::Other: break;
    }
    return {};
}

Extraction Extractor::extract_html(const std::string& html, const std::string& base_url) {
    if (html.empty())
        return {};

    GumboOutputPtr output(
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output)
        return {};

    HtmlWalker walker(base_url);
    walker.walk(output->root);
    return walker.take();
}

Extraction Extractor::extract_js(const std::string& script, const std::string& base_url) {
    Extraction extraction;
    JsFindings findings = JsScanner::scan(script);

    extraction.functions = std::move(findings.functions);
    for (const auto& endpoint : findings.endpoints) {
        std::string value = trim(endpoint);
        if (value.empty() || value[0] == '#')
            continue;
        extraction.links.push_back({Url::resolve(base_url, value), LinkContext::ScriptReference});
    }
    return extraction;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Webscout

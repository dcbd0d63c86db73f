#pragma once
#include <string>
#include <vector>

namespace Webscout {
namespace Utils {
namespace Text {

struct JsFindings {
    std::vector<std::string> functions;  // discovery order, may repeat
    std::vector<std::string> endpoints;  // raw URL literals from request call sites
};

/**
 * Lexical scan of JavaScript source. No parsing or evaluation: comments,
 * strings, template and regex literals are tokenized and skipped, and the
 * token stream is matched against declaration and call-site shapes:
 *
 *   function NAME / function* NAME / async function NAME
 *   NAME = function / NAME: function / NAME = (...) => / NAME = x =>
 *   fetch('u'), axios[.verb]('u'), $.ajax|get|post|getJSON('u'),
 *   xhr.open('GET', 'u'), { url: 'u' }
 *
 * Never throws; unterminated constructs end the scan with what was found.
 */
class JsScanner {
public:
    static JsFindings scan(const std::string& source);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Webscout

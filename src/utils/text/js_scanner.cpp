#include "js_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>
#include <unordered_set>

namespace Webscout {
namespace Utils {
namespace Text {

namespace {

enum class TokenType { Identifier, Number, String, Punct };

struct Token {
    TokenType   type;
    std::string text;
};

constexpr size_t MAX_ARROW_PARAM_TOKENS = 64;

const std::unordered_set<std::string_view>& reserved_words() {
    static const std::unordered_set<std::string_view> words = {
        "break",  "case",   "catch",    "class", "const",      "continue", "debugger",
        "default", "delete", "do",      "else",  "export",     "extends",  "finally",
        "for",    "function", "if",     "import", "in",        "instanceof", "new",
        "return", "super",  "switch",   "this",  "throw",      "try",      "typeof",
        "var",    "void",   "while",    "with",  "yield",      "let",      "static",
        "await",  "async",  "of",       "null",  "true",       "false",    "undefined"};
    return words;
}

// After these a '/' starts a regex literal rather than a division.
const std::unordered_set<std::string_view>& regex_prefix_keywords() {
    static const std::unordered_set<std::string_view> words = {
        "return", "typeof", "case", "do", "else", "in", "of", "new", "delete", "void", "throw"};
    return words;
}

bool is_ident_start(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool is_ident_part(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {
    }

    std::vector<Token> run() {
        std::vector<Token> tokens;
        while (pos_ < src_.size()) {
            unsigned char c = static_cast<unsigned char>(src_[pos_]);

            if (std::isspace(c)) {
                ++pos_;
                continue;
            }

            if (c == '/' && peek(1) == '/') {
                skip_line_comment();
                continue;
            }
            if (c == '/' && peek(1) == '*') {
                skip_block_comment();
                continue;
            }
            if (c == '/' && regex_allowed(tokens)) {
                skip_regex();
                continue;
            }

            if (c == '"' || c == '\'') {
                tokens.push_back({TokenType::String, read_string(static_cast<char>(c))});
                continue;
            }
            if (c == '`') {
                bool        interpolated = false;
                std::string value        = read_template(interpolated);
                // An interpolated template is not a usable literal.
                tokens.push_back({interpolated ? TokenType::Punct : TokenType::String,
                                  interpolated ? "`" : value});
                continue;
            }

            if (is_ident_start(c)) {
                size_t start = pos_;
                while (pos_ < src_.size() && is_ident_part(static_cast<unsigned char>(src_[pos_])))
                    ++pos_;
                tokens.push_back(
                    {TokenType::Identifier, std::string(src_.substr(start, pos_ - start))});
                continue;
            }

            if (std::isdigit(c)) {
                size_t start = pos_;
                while (pos_ < src_.size()
                       && (is_ident_part(static_cast<unsigned char>(src_[pos_]))
                           || src_[pos_] == '.'))
                    ++pos_;
                tokens.push_back({TokenType::Number, std::string(src_.substr(start, pos_ - start))});
                continue;
            }

            tokens.push_back({TokenType::Punct, read_punct()});
        }
        return tokens;
    }

private:
    std::string_view src_;
    size_t           pos_ = 0;

    char peek(size_t offset) const {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    void skip_line_comment() {
        while (pos_ < src_.size() && src_[pos_] != '\n')
            ++pos_;
    }

    void skip_block_comment() {
        pos_ += 2;
        while (pos_ + 1 < src_.size() && !(src_[pos_] == '*' && src_[pos_ + 1] == '/'))
            ++pos_;
        pos_ = std::min(pos_ + 2, src_.size());
    }

    static bool regex_allowed(const std::vector<Token>& tokens) {
        if (tokens.empty())
            return true;
        const Token& prev = tokens.back();
        switch (prev.type) {
            case TokenType::Number:
            case TokenType::String: return false;
            case TokenType::Identifier: return regex_prefix_keywords().count(prev.text) > 0;
            case TokenType::Punct: return prev.text != ")" && prev.text != "]" && prev.text != "}";
        }
        return false;
    }

    void skip_regex() {
        size_t start    = pos_;
        bool   in_class = false;
        ++pos_;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\n') {
                // Not a regex after all; treat the slash as an operator.
                pos_ = start + 1;
                return;
            }
            if (c == '\\') {
                pos_ += 2;
                continue;
            }
            if (c == '[')
                in_class = true;
            else if (c == ']')
                in_class = false;
            else if (c == '/' && !in_class) {
                ++pos_;
                while (pos_ < src_.size() && std::isalpha(static_cast<unsigned char>(src_[pos_])))
                    ++pos_;
                return;
            }
            ++pos_;
        }
    }

    std::string read_string(char quote) {
        std::string value;
        ++pos_;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\\' && pos_ + 1 < src_.size()) {
                value += src_[pos_ + 1];
                pos_ += 2;
                continue;
            }
            if (c == quote || c == '\n') {
                ++pos_;
                break;
            }
            value += c;
            ++pos_;
        }
        return value;
    }

    std::string read_template(bool& interpolated) {
        std::string value;
        ++pos_;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\\' && pos_ + 1 < src_.size()) {
                value += src_[pos_ + 1];
                pos_ += 2;
                continue;
            }
            if (c == '`') {
                ++pos_;
                break;
            }
            if (c == '$' && peek(1) == '{') {
                interpolated = true;
                skip_substitution();
                continue;
            }
            value += c;
            ++pos_;
        }
        return value;
    }

    void skip_substitution() {
        pos_ += 2;
        int depth = 1;
        while (pos_ < src_.size() && depth > 0) {
            char c = src_[pos_];
            if (c == '"' || c == '\'') {
                read_string(c);
                continue;
            }
            if (c == '`') {
                bool nested = false;
                read_template(nested);
                continue;
            }
            if (c == '{')
                ++depth;
            else if (c == '}')
                --depth;
            ++pos_;
        }
    }

    std::string read_punct() {
        static constexpr std::string_view three[] = {"===", "!==", "...", "**=", "<<=", ">>="};
        static constexpr std::string_view two[]   = {"=>", "==", "!=", "<=", ">=", "&&", "||",
                                                     "??", "?.", "+=", "-=", "*=", "/=", "%=",
                                                     "&=", "|=", "^=", "++", "--", "**", "<<", ">>"};
        std::string_view rest = src_.substr(pos_);
        for (auto op : three) {
            if (rest.substr(0, 3) == op) {
                pos_ += 3;
                return std::string(op);
            }
        }
        for (auto op : two) {
            if (rest.substr(0, 2) == op) {
                pos_ += 2;
                return std::string(op);
            }
        }
        return std::string(1, src_[pos_++]);
    }
};

class Matcher {
public:
    explicit Matcher(const std::vector<Token>& tokens) : tokens_(tokens) {
    }

    JsFindings run() {
        JsFindings findings;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            match_declaration(i, findings);
            match_assignment(i, findings);
            match_request(i, findings);
        }
        return findings;
    }

private:
    const std::vector<Token>& tokens_;

    bool is(size_t i, TokenType type, std::string_view text = {}) const {
        if (i >= tokens_.size() || tokens_[i].type != type)
            return false;
        return text.empty() || tokens_[i].text == text;
    }

    bool is_name(size_t i) const {
        return is(i, TokenType::Identifier) && reserved_words().count(tokens_[i].text) == 0;
    }

    // function NAME / function* NAME
    void match_declaration(size_t i, JsFindings& findings) const {
        if (!is(i, TokenType::Identifier, "function"))
            return;
        size_t j = i + 1;
        if (is(j, TokenType::Punct, "*"))
            ++j;
        if (is_name(j))
            findings.functions.push_back(tokens_[j].text);
    }

    // NAME = function / NAME: function / NAME = (...) => / NAME = x =>
    void match_assignment(size_t i, JsFindings& findings) const {
        if (!is_name(i))
            return;
        if (!is(i + 1, TokenType::Punct, "=") && !is(i + 1, TokenType::Punct, ":"))
            return;
        size_t j = i + 2;
        if (is(j, TokenType::Identifier, "async"))
            ++j;

        if (is(j, TokenType::Identifier, "function") || is_arrow_at(j))
            findings.functions.push_back(tokens_[i].text);
    }

    bool is_arrow_at(size_t j) const {
        if (is_name(j))
            return is(j + 1, TokenType::Punct, "=>");
        if (!is(j, TokenType::Punct, "("))
            return false;

        int    depth = 0;
        size_t limit = std::min(tokens_.size(), j + MAX_ARROW_PARAM_TOKENS);
        for (size_t k = j; k < limit; ++k) {
            if (is(k, TokenType::Punct, "("))
                ++depth;
            else if (is(k, TokenType::Punct, ")") && --depth == 0)
                return is(k + 1, TokenType::Punct, "=>");
        }
        return false;
    }

    void match_request(size_t i, JsFindings& findings) const {
        if (is(i, TokenType::Identifier, "fetch") && is(i + 1, TokenType::Punct, "(")
            && is(i + 2, TokenType::String)) {
            findings.endpoints.push_back(tokens_[i + 2].text);
            return;
        }

        if (is(i, TokenType::Identifier, "axios")) {
            if (is(i + 1, TokenType::Punct, "(") && is(i + 2, TokenType::String)) {
                findings.endpoints.push_back(tokens_[i + 2].text);
            }
            else if (is(i + 1, TokenType::Punct, ".")
                     && is_one_of(i + 2, {"get", "post", "put", "delete", "patch", "head"})
                     && is(i + 3, TokenType::Punct, "(") && is(i + 4, TokenType::String)) {
                findings.endpoints.push_back(tokens_[i + 4].text);
            }
            return;
        }

        if ((is(i, TokenType::Identifier, "$") || is(i, TokenType::Identifier, "jQuery"))
            && is(i + 1, TokenType::Punct, ".")
            && is_one_of(i + 2, {"ajax", "get", "post", "getJSON", "load"})
            && is(i + 3, TokenType::Punct, "(") && is(i + 4, TokenType::String)) {
            findings.endpoints.push_back(tokens_[i + 4].text);
            return;
        }

        // xhr.open('GET', '/path')
        if (is(i, TokenType::Punct, ".") && is(i + 1, TokenType::Identifier, "open")
            && is(i + 2, TokenType::Punct, "(") && is(i + 3, TokenType::String)
            && is(i + 4, TokenType::Punct, ",") && is(i + 5, TokenType::String)
            && is_http_method(tokens_[i + 3].text)) {
            findings.endpoints.push_back(tokens_[i + 5].text);
            return;
        }

        // { url: '/path' } or { "url": "/path" }
        bool url_key = is(i, TokenType::Identifier, "url") || is(i, TokenType::String, "url");
        if (url_key && is(i + 1, TokenType::Punct, ":") && is(i + 2, TokenType::String)) {
            findings.endpoints.push_back(tokens_[i + 2].text);
        }
    }

    bool is_one_of(size_t i, std::initializer_list<std::string_view> names) const {
        if (!is(i, TokenType::Identifier))
            return false;
        for (auto name : names) {
            if (tokens_[i].text == name)
                return true;
        }
        return false;
    }

    static bool is_http_method(const std::string& text) {
        if (text.empty() || text.size() > 7)
            return false;
        for (char c : text) {
            if (!std::isalpha(static_cast<unsigned char>(c)))
                return false;
        }
        return true;
    }
};

}  // namespace

JsFindings JsScanner::scan(const std::string& source) {
    if (source.empty())
        return {};
    std::vector<Token> tokens = Lexer(source).run();
    return Matcher(tokens).run();
}

}  // namespace Text
}  // namespace Utils
}  // namespace Webscout

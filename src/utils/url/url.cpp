#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>

#include "../text/string_utils.hpp"

namespace Webscout {
namespace Utils {

namespace {

// Length of a leading "scheme:" (excluding the colon), 0 when there is none.
size_t scheme_length(std::string_view sv) {
    if (sv.empty() || !std::isalpha(static_cast<unsigned char>(sv[0])))
        return 0;
    for (size_t i = 1; i < sv.size(); ++i) {
        char c = sv[i];
        if (c == ':')
            return i;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.')
            return 0;
    }
    return 0;
}

std::string default_port(const std::string& scheme) {
    if (scheme == "http")
        return "80";
    if (scheme == "https")
        return "443";
    return "";
}

std::string join_authority(const UrlParsed& p) {
    std::string auth = p.host;
    if (!p.port.empty())
        auth += ":" + p.port;
    return auth;
}

// Browsers drop tabs and newlines inside URLs and send spaces encoded.
std::string clean_link(const std::string& raw) {
    std::string trimmed = Text::trim(raw);
    std::string out;
    out.reserve(trimmed.size());
    for (char c : trimmed) {
        if (c == '\t' || c == '\r' || c == '\n')
            continue;
        if (c == ' ') {
            out += "%20";
            continue;
        }
        out += c;
    }
    return out;
}

bool valid_host(const std::string& host) {
    if (host.empty())
        return false;
    if (host.front() == '[')
        return host.back() == ']';
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '%';
    });
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon = scheme_length(sv);
    if (colon != 0) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::remove_dot_segments(const std::string& path) {
    if (path.empty())
        return "/";

    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    bool                     trailing_dir = false;
    while (std::getline(ss, segment, '/')) {
        trailing_dir = false;
        if (segment.empty())
            continue;
        if (segment == ".") {
            trailing_dir = true;
            continue;
        }
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            trailing_dir = true;
            continue;
        }
        segments.push_back(segment);
    }
    if (path.back() == '/')
        trailing_dir = true;

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }
    if (trailing_dir && normalized.back() != '/')
        normalized += "/";
    return normalized;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    std::string rel = clean_link(relative);
    if (rel.empty())
        return base;

    if (scheme_length(rel) != 0)
        return rel;

    UrlParsed   b      = parse(base);
    std::string origin = b.scheme + "://" + join_authority(b);

    if (rel.rfind("//", 0) == 0)
        return b.scheme + ":" + rel;

    if (rel[0] == '#') {
        std::string res = origin + b.path;
        if (!b.query.empty())
            res += "?" + b.query;
        return res + rel;
    }

    if (rel[0] == '?')
        return origin + b.path + rel;

    size_t      qf     = rel.find_first_of("?#");
    std::string path   = rel.substr(0, qf);
    std::string suffix = (qf == std::string::npos) ? "" : rel.substr(qf);

    if (path[0] != '/') {
        size_t      last_slash = b.path.find_last_of('/');
        std::string dir =
            (last_slash == std::string::npos) ? "/" : b.path.substr(0, last_slash + 1);
        path = dir + path;
    }

    return origin + remove_dot_segments(path) + suffix;
}

std::optional<std::string> Url::normalize(const std::string& raw, const std::string& base) {
    std::string link = clean_link(raw);
    if (link.empty())
        return std::nullopt;

    std::string absolute = base.empty() ? link : resolve(base, link);
    UrlParsed   p        = parse(absolute);

    std::string scheme = Text::to_lower(p.scheme);
    if (scheme != "http" && scheme != "https")
        return std::nullopt;

    std::string host = Text::to_lower(p.host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    if (!valid_host(host))
        return std::nullopt;

    std::string port = p.port;
    if (!port.empty()) {
        bool digits = std::all_of(
            port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); });
        if (!digits || port.size() > 5)
            return std::nullopt;
        int value = std::stoi(port);
        if (value <= 0 || value > 65535)
            return std::nullopt;
        port = std::to_string(value);
        if (port == default_port(scheme))
            port.clear();
    }

    std::string result = scheme + "://" + host;
    if (!port.empty())
        result += ":" + port;
    result += remove_dot_segments(p.path);
    if (!p.query.empty())
        result += "?" + p.query;
    return result;
}

std::string Url::authority(const std::string& url) {
    auto normalized = normalize(url);
    if (!normalized)
        return "";
    return join_authority(parse(*normalized));
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    std::string a1 = authority(url1);
    return !a1.empty() && a1 == authority(url2);
}

std::string Url::strip_query(const std::string& url) {
    size_t qf = url.find_first_of("?#");
    if (qf == std::string::npos)
        return url;
    return url.substr(0, qf);
}

std::string Url::to_report_name(const std::string& url) {
    UrlParsed   p    = parse(url);
    std::string name = Text::to_lower(p.host);
    if (!p.port.empty())
        name += "_" + p.port;
    for (char& c : name) {
        if (c == ':' || c == '/' || c == '[' || c == ']')
            c = '_';
    }
    if (name.empty())
        name = "target";
    return name;
}

}  // namespace Utils
}  // namespace Webscout

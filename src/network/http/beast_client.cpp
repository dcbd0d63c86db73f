#include "beast_client.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Webscout {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

Response error_response(const std::string& url, ErrorType type, const std::string& message) {
    Response response;
    response.effective_url = url;
    response.success       = false;
    response.error         = message;
    response.error_type    = type;
    response.status_code   = 0;
    return response;
}

// Writes the request and reads the response on an established stream.
template <class Stream>
net::awaitable<void> exchange(Stream&            stream,
                              const std::string& host_header,
                              const std::string& target,
                              const std::string& user_agent,
                              std::size_t        max_body,
                              Response&          response,
                              std::string&       location) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host_header);
    req.set(http::field::user_agent, user_agent);
    req.set(http::field::accept, "*/*");
    req.set(http::field::connection, "close");

    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                        b;
    http::response_parser<http::string_body> parser;
    parser.body_limit(max_body);
    co_await http::async_read(stream, b, parser, net::use_awaitable);

    auto& res            = parser.get();
    response.status_code = res.result_int();
    auto ct              = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    auto loc = res.find(http::field::location);
    if (loc != res.end())
        location = std::string(loc->value());
    response.body = std::move(res.body());
}

}  // namespace

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::ConnectionRefused: return "connection-refused";
        case ErrorType::HttpStatus: return "http-status";
        case ErrorType::TooLarge: return "too-large";
        case ErrorType::Malformed: return "malformed";
        case ErrorType::Network: return "network";
        case ErrorType::InvalidUrl: return "invalid-url";
    }
    return "unknown";
}

BeastClient::BeastClient() : user_agent_(Webscout::Core::Constants::USER_AGENT) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void BeastClient::set_max_body_size(std::size_t bytes) {
    max_body_size_ = bytes;
}

void BeastClient::set_max_redirects(int redirects) {
    max_redirects_ = redirects;
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

ErrorType BeastClient::classify_error(const boost::system::error_code& ec) {
    if (ec == beast::error::timeout || ec == net::error::timed_out)
        return ErrorType::Timeout;
    if (ec == net::error::connection_refused)
        return ErrorType::ConnectionRefused;
    if (ec == http::error::body_limit)
        return ErrorType::TooLarge;
    if (ec.category() == http::make_error_code(http::error::bad_version).category())
        return ErrorType::Malformed;
    return ErrorType::Network;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    std::string current = url;

    for (int hop = 0;; ++hop) {
        std::string location;
        Response    response = co_await do_request(current, location);

        if (response.error_type != ErrorType::None)
            co_return response;

        bool redirect = response.status_code >= 300 && response.status_code < 400
                        && !location.empty();
        if (redirect) {
            auto next = Webscout::Utils::Url::normalize(location, current);
            if (!next) {
                co_return error_response(
                    current, ErrorType::InvalidUrl, "Unusable redirect target: " + location);
            }
            if (hop < max_redirects_) {
                current = *next;
                continue;
            }
            response.location = *next;
        }

        response.success = response.status_code >= 200 && response.status_code < 300;
        if (!response.success) {
            response.error_type = ErrorType::HttpStatus;
            response.error      = "HTTP " + std::to_string(response.status_code);
        }
        co_return response;
    }
}

net::awaitable<Response> BeastClient::do_request(const std::string& url, std::string& location) {
    auto parsed = Webscout::Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        co_return error_response(url, ErrorType::InvalidUrl, "Invalid URL");
    }

    bool        is_ssl = (parsed.scheme == "https");
    std::string host   = parsed.host;
    std::string port   = parsed.port.empty() ? (is_ssl ? "443" : "80") : parsed.port;
    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;

    try {
        if (!is_ssl) {
            co_return co_await perform_http_request(host, port, target, url, location);
        }
        else {
            co_return co_await perform_https_request(host, port, target, url, location);
        }
    } catch (const boost::system::system_error& e) {
        co_return error_response(url, classify_error(e.code()), e.code().message());
    } catch (const std::exception& e) {
        co_return error_response(url, ErrorType::Network, e.what());
    }
}

net::awaitable<Response> BeastClient::perform_http_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target,
                                                           const std::string& effective_url,
                                                           std::string&       location) {
    Response response;
    response.effective_url = effective_url;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    // One deadline for connect, write and read.
    stream.expires_after(timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    std::string host_header = (port == "80") ? host : host + ":" + port;
    co_await exchange(stream, host_header, target, user_agent_, max_body_size_, response, location);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const std::string& host,
                                                            const std::string& port,
                                                            const std::string& target,
                                                            const std::string& effective_url,
                                                            std::string&       location) {
    Response response;
    response.effective_url = effective_url;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_after(timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    std::string host_header = (port == "443") ? host : host + ":" + port;
    co_await exchange(
        ssl_stream, host_header, target, user_agent_, max_body_size_, response, location);

    // Many servers skip close_notify; the response is already complete.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Webscout

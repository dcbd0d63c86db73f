#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace Webscout {
namespace Network {
namespace Http {

enum class ErrorType {
    None,
    Timeout,
    ConnectionRefused,
    HttpStatus,  // 4xx/5xx (or unfollowed 3xx), code in status_code
    TooLarge,
    Malformed,
    Network,  // resolve failures, resets, TLS errors
    InvalidUrl
};

const char* to_string(ErrorType type);

}  // namespace Http
}  // namespace Network
}  // namespace Webscout

namespace Webscout {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              body;
    std::string              error;
    // Absolute target of a 3xx the client did not follow.
    std::string              location;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;

    bool is_redirect() const {
        return status_code >= 300 && status_code < 400 && !location.empty();
    }
};

namespace Network {
namespace Http {

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual void set_max_body_size(std::size_t /*bytes*/){};
    virtual void set_max_redirects(int /*redirects*/){};
    virtual void set_user_agent(const std::string& /*user_agent*/){};
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Webscout

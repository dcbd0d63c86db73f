#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "http_client.hpp"

namespace Webscout {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_timeout(std::chrono::milliseconds timeout) override;
    void set_max_body_size(std::size_t bytes) override;
    void set_max_redirects(int redirects) override;
    void set_user_agent(const std::string& user_agent) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

    // Maps a transport or parser failure onto the fetch error taxonomy.
    static ErrorType classify_error(const boost::system::error_code& ec);

private:
    std::chrono::milliseconds timeout_{10000};
    std::size_t               max_body_size_ = 5 * 1024 * 1024;
    int                       max_redirects_ = 5;
    std::string               user_agent_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Response> do_request(const std::string& url, std::string& location);

    boost::asio::awaitable<Response> perform_http_request(const std::string& host,
                                                          const std::string& port,
                                                          const std::string& target,
                                                          const std::string& effective_url,
                                                          std::string&       location);
    boost::asio::awaitable<Response> perform_https_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target,
                                                           const std::string& effective_url,
                                                           std::string&       location);
};

}  // namespace Http
}  // namespace Network
}  // namespace Webscout

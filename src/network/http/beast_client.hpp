#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <string>
#include "../../utils/url/url.hpp"
#include "http_client.hpp"

namespace Trawl {
namespace Network {
namespace Http {

// Plain and TLS HTTP/1.1 over Beast. Follows up to MAX_REDIRECTS redirects for GET and HEAD.
// Never throws: transport failures come back as a Response with error_type set.
class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    boost::asio::awaitable<Response> get(const std::string&    url,
                                         const RequestOptions& options) override;
    boost::asio::awaitable<Response> head(const std::string&    url,
                                          const RequestOptions& options) override;
    boost::asio::awaitable<Response> post(const std::string&    url,
                                          const std::string&    body,
                                          const RequestOptions& options) override;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Response> do_request(boost::beast::http::verb method,
                                                const std::string&       url,
                                                const std::string&       body,
                                                const RequestOptions&    options);

    boost::asio::awaitable<Response> perform_http_request(const Utils::UrlParsed& target,
                                                          boost::beast::http::verb method,
                                                          const std::string&       body,
                                                          const RequestOptions&    options,
                                                          Deadline                 deadline);
    boost::asio::awaitable<Response> perform_https_request(const Utils::UrlParsed& target,
                                                           boost::beast::http::verb method,
                                                           const std::string&       body,
                                                           const RequestOptions&    options,
                                                           Deadline                 deadline);
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl

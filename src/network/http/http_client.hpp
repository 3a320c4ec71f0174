#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"

namespace Trawl {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Render, Unavailable, Other };

}  // namespace Http
}  // namespace Network
}  // namespace Trawl

namespace Trawl {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              location;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

struct RequestOptions {
    std::chrono::milliseconds timeout{Core::Constants::REQUEST_TIMEOUT_SECONDS * 1000};
    std::string               user_agent = Core::Constants::USER_AGENT;
    std::string               content_type;
    std::vector<std::pair<std::string, std::string>> headers;
    bool                      follow_redirects = true;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual boost::asio::awaitable<Response> get(const std::string&    url,
                                                 const RequestOptions& options) = 0;
    virtual boost::asio::awaitable<Response> head(const std::string&    url,
                                                  const RequestOptions& options) = 0;
    virtual boost::asio::awaitable<Response> post(const std::string&    url,
                                                  const std::string&    body,
                                                  const RequestOptions& options) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl

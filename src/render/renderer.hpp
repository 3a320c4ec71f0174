#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>
#include "../core/types/constants.hpp"
#include "../network/http/http_client.hpp"

namespace Trawl {
namespace Render {

struct RenderOptions {
    std::chrono::milliseconds timeout{Core::Constants::REQUEST_TIMEOUT_SECONDS * 1000};
    std::string               user_agent = Core::Constants::USER_AGENT;
};

// Turns a URL into raw HTML. Failures are reported through Response::error_type:
// Timeout, Network and Render are per-page and retryable, Unavailable means the
// backend itself is gone.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual boost::asio::awaitable<Response> fetch(const std::string&   url,
                                                   const RenderOptions& options) = 0;
};

}  // namespace Render
}  // namespace Trawl

#include "http_renderer.hpp"

namespace Trawl {
namespace Render {

HttpRenderer::HttpRenderer(std::shared_ptr<Network::Http::HttpClient> client)
    : client_(std::move(client)) {
}

boost::asio::awaitable<Response> HttpRenderer::fetch(const std::string&   url,
                                                     const RenderOptions& options) {
    Network::Http::RequestOptions request;
    request.timeout    = options.timeout;
    request.user_agent = options.user_agent;
    request.headers.emplace_back("Accept", "text/html,application/xhtml+xml,*/*;q=0.8");
    co_return co_await client_->get(url, request);
}

}  // namespace Render
}  // namespace Trawl

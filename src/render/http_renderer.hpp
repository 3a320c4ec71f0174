#pragma once
#include <memory>
#include "../network/http/http_client.hpp"
#include "renderer.hpp"

namespace Trawl {
namespace Render {

class HttpRenderer : public Renderer {
public:
    explicit HttpRenderer(std::shared_ptr<Network::Http::HttpClient> client);
    ~HttpRenderer() override = default;

    boost::asio::awaitable<Response> fetch(const std::string&   url,
                                           const RenderOptions& options) override;

private:
    std::shared_ptr<Network::Http::HttpClient> client_;
};

}  // namespace Render
}  // namespace Trawl

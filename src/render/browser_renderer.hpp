#pragma once
#include <string>
#include "renderer.hpp"

namespace Trawl {
namespace Render {

// Renders pages in Chromium through the DevTools protocol, one tab per fetch.
class BrowserRenderer : public Renderer {
public:
    BrowserRenderer(std::string host, int port);
    ~BrowserRenderer() override = default;

    boost::asio::awaitable<Response> fetch(const std::string&   url,
                                           const RenderOptions& options) override;

private:
    std::string host_;
    int         port_;
};

}  // namespace Render
}  // namespace Trawl

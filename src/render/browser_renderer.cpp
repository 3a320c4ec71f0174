#include "browser_renderer.hpp"
#include "../browser/cdp/cdp_client.hpp"
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Trawl {
namespace Render {

using namespace Trawl::Core;
using Network::Http::ErrorType;

BrowserRenderer::BrowserRenderer(std::string host, int port) : host_(std::move(host)), port_(port) {
}

boost::asio::awaitable<Response> BrowserRenderer::fetch(const std::string&   url,
                                                        const RenderOptions& options) {
    Response res;
    res.effective_url = url;

    if (!Utils::Url::is_http(url)) {
        res.error      = "Invalid URL scheme";
        res.error_type = ErrorType::Other;
        co_return res;
    }

    Browser::CDP::CDPClient cdp(
        co_await boost::asio::this_coro::executor, host_, port_, options.timeout);
    if (!co_await cdp.connect()) {
        res.error      = "Browser unavailable at " + host_ + ":" + std::to_string(port_);
        res.error_type = ErrorType::Unavailable;
        co_return res;
    }

    try {
        Logger::info("Browser: Navigating to " + url);
        res.body = co_await cdp.render(url);
    } catch (const RenderError& e) {
        res.error = e.what();
        res.error_type =
            Utils::Text::starts_with(res.error, "timeout") ? ErrorType::Timeout : ErrorType::Render;
        if (res.error_type == ErrorType::Timeout)
            res.error = "timeout";
        co_return res;
    }

    if (res.body.empty()) {
        res.error      = "Browser returned empty content";
        res.error_type = ErrorType::Render;
        co_return res;
    }

    res.status_code  = 200;
    res.content_type = "text/html";
    res.success      = true;
    co_return res;
}

}  // namespace Render
}  // namespace Trawl

#include "cdp_client.hpp"
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http.hpp>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Browser {
namespace CDP {

using namespace Trawl::Core;

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

constexpr std::chrono::seconds kConnectTimeout{5};

CDPClient::CDPClient(net::any_io_executor      executor,
                     std::string               host,
                     int                       port,
                     std::chrono::milliseconds timeout)
    : executor_(executor),
      host_(std::move(host)),
      port_(port),
      timeout_(timeout),
      deadline_(std::chrono::steady_clock::now() + timeout),
      ws_(executor) {
}

void CDPClient::check_deadline(const std::string& stage) const {
    if (std::chrono::steady_clock::now() > deadline_)
        throw RenderError("timeout during " + stage);
}

net::awaitable<std::optional<std::string>> CDPClient::devtools_request(const std::string& target) {
    try {
        tcp::resolver resolver(executor_);
        auto          results = co_await resolver.async_resolve(
            host_, std::to_string(port_), net::use_awaitable);

        beast::tcp_stream stream(executor_);
        stream.expires_after(kConnectTimeout);
        co_await stream.async_connect(results, net::use_awaitable);

        http::request<http::empty_body> req{http::verb::put, target, 11};
        req.set(http::field::host, host_ + ":" + std::to_string(port_));
        co_await http::async_write(stream, req, net::use_awaitable);

        beast::flat_buffer                b;
        http::response<http::string_body> res;
        co_await http::async_read(stream, b, res, net::use_awaitable);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (res.result() != http::status::ok)
            co_return std::nullopt;
        co_return res.body();
    } catch (const beast::system_error& e) {
        Logger::warn("CDP: DevTools endpoint " + host_ + ":" + std::to_string(port_) + " " +
                     e.code().message());
        co_return std::nullopt;
    }
}

net::awaitable<std::string> CDPClient::get_web_socket_url() {
    auto body = co_await devtools_request("/json/new?about:blank");
    if (!body)
        co_return "";

    try {
        auto j  = nlohmann::json::parse(*body);
        tab_id_ = j.at("id").get<std::string>();
        co_return j.at("webSocketDebuggerUrl").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        Logger::warn(std::string("CDP: Unexpected /json/new reply: ") + e.what());
        co_return "";
    }
}

net::awaitable<bool> CDPClient::connect() {
    std::string ws_url = co_await get_web_socket_url();
    if (ws_url.empty())
        co_return false;

    auto parsed = Utils::Url::parse(ws_url);
    try {
        tcp::resolver resolver(executor_);
        auto          results = co_await resolver.async_resolve(
            host_, std::to_string(port_), net::use_awaitable);

        beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
        co_await beast::get_lowest_layer(ws_).async_connect(results, net::use_awaitable);
        beast::get_lowest_layer(ws_).expires_never();

        websocket::stream_base::timeout opt{kConnectTimeout, timeout_, false};
        ws_.set_option(opt);
        ws_.read_message_max(64 * 1024 * 1024);

        co_await ws_.async_handshake(
            host_ + ":" + std::to_string(port_), parsed.path, net::use_awaitable);
    } catch (const beast::system_error& e) {
        Logger::warn("CDP: Websocket connect failed: " + e.code().message());
        co_return false;
    }

    connected_ = true;
    co_return true;
}

net::awaitable<int> CDPClient::send_command(const std::string& method, const nlohmann::json& params) {
    int            id  = current_id_++;
    nlohmann::json msg = {{"id", id}, {"method", method}};
    if (!params.is_null())
        msg["params"] = params;
    co_await ws_.async_write(net::buffer(msg.dump()), net::use_awaitable);
    co_return id;
}

net::awaitable<nlohmann::json> CDPClient::read_message() {
    beast::flat_buffer buffer;
    try {
        co_await ws_.async_read(buffer, net::use_awaitable);
    } catch (const beast::system_error& e) {
        if (e.code() == beast::error::timeout)
            throw RenderError("timeout");
        throw RenderError("CDP connection lost: " + e.code().message());
    }
    auto j = nlohmann::json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
    if (j.is_discarded())
        throw RenderError("CDP sent malformed JSON");
    co_return j;
}

net::awaitable<nlohmann::json> CDPClient::wait_for_id(int id) {
    for (;;) {
        auto it = responses_.find(id);
        if (it != responses_.end()) {
            auto msg = std::move(it->second);
            responses_.erase(it);
            if (msg.contains("error"))
                throw RenderError("CDP error: " + msg["error"].dump());
            co_return msg;
        }
        check_deadline("command");
        auto j = co_await read_message();
        if (j.contains("id"))
            responses_[j["id"].get<int>()] = std::move(j);
        else
            events_.push_back(std::move(j));
    }
}

net::awaitable<nlohmann::json> CDPClient::wait_for_event(const std::string& method) {
    for (;;) {
        for (auto it = events_.begin(); it != events_.end(); ++it) {
            if (it->value("method", "") == method) {
                auto msg = std::move(*it);
                events_.erase(it);
                co_return msg;
            }
        }
        check_deadline(method);
        auto j = co_await read_message();
        if (j.contains("id"))
            responses_[j["id"].get<int>()] = std::move(j);
        else
            events_.push_back(std::move(j));
    }
}

net::awaitable<void> CDPClient::navigate(const std::string& url) {
    if (!connected_)
        throw RenderError("CDP not connected");

    int enable_id = co_await send_command("Page.enable", nullptr);
    co_await wait_for_id(enable_id);

    nlohmann::json nav_params = {{"url", url}};
    int            nav_id     = co_await send_command("Page.navigate", nav_params);
    auto reply  = co_await wait_for_id(nav_id);
    if (reply.contains("result") && reply["result"].contains("errorText")) {
        throw RenderError("Navigation failed: " + reply["result"]["errorText"].get<std::string>());
    }

    co_await wait_for_event("Page.loadEventFired");
}

net::awaitable<std::string> CDPClient::evaluate(const std::string& expression) {
    if (!connected_)
        throw RenderError("CDP not connected");

    nlohmann::json eval_params = {{"expression", expression}, {"returnByValue", true}};
    int            eval_id     = co_await send_command("Runtime.evaluate", eval_params);
    auto j = co_await wait_for_id(eval_id);

    if (j.contains("result") && j["result"].contains("result") &&
        j["result"]["result"].contains("value") && j["result"]["result"]["value"].is_string()) {
        co_return j["result"]["result"]["value"].get<std::string>();
    }
    throw RenderError("Runtime.evaluate returned no value");
}

net::awaitable<void> CDPClient::close() {
    if (connected_) {
        beast::error_code ec;
        co_await ws_.async_close(websocket::close_code::normal,
                                 net::redirect_error(net::use_awaitable, ec));
        connected_ = false;
    }
    if (!tab_id_.empty()) {
        auto closed = co_await devtools_request("/json/close/" + tab_id_);
        if (!closed)
            Logger::warn("CDP: Failed to close tab " + tab_id_);
        tab_id_.clear();
    }
}

net::awaitable<std::string> CDPClient::render(const std::string& url) {
    std::string html;
    std::string failure;
    try {
        co_await navigate(url);
        html = co_await evaluate("document.documentElement.outerHTML");
    } catch (const RenderError& e) {
        failure = e.what();
    } catch (const std::exception& e) {
        failure = std::string("CDP failure: ") + e.what();
    }
    co_await close();
    if (!failure.empty())
        throw RenderError(failure);
    co_return html;
}

}  // namespace CDP
}  // namespace Browser
}  // namespace Trawl

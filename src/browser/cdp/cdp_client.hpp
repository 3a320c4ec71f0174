#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Trawl {
namespace Browser {
namespace CDP {

// One DevTools tab driven over the Chrome remote debugging websocket.
// A client renders a single page and is not shared between coroutines.
class CDPClient {
public:
    CDPClient(boost::asio::any_io_executor executor,
              std::string                  host,
              int                          port,
              std::chrono::milliseconds    timeout);

    // Navigates the connected tab, waits for the load event and returns the rendered DOM.
    // The tab is closed afterwards. Throws Core::RenderError if the page cannot be loaded.
    boost::asio::awaitable<std::string> render(const std::string& url);

    // False if the DevTools endpoint is unreachable.
    boost::asio::awaitable<bool>        connect();
    boost::asio::awaitable<void>        navigate(const std::string& url);
    boost::asio::awaitable<std::string> evaluate(const std::string& expression);
    boost::asio::awaitable<void>        close();

    bool connected() const {
        return connected_;
    }

private:
    using Deadline = std::chrono::steady_clock::time_point;

    boost::asio::any_io_executor                              executor_;
    std::string                                               host_;
    int                                                       port_;
    std::chrono::milliseconds                                 timeout_;
    Deadline                                                  deadline_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    bool                                                      connected_ = false;

    int         current_id_ = 1;
    std::string tab_id_;

    std::map<int, nlohmann::json> responses_;
    std::deque<nlohmann::json>    events_;

    boost::asio::awaitable<std::optional<std::string>> devtools_request(const std::string& target);
    boost::asio::awaitable<std::string>                get_web_socket_url();
    boost::asio::awaitable<int>                        send_command(const std::string&    method,
                                                                    const nlohmann::json& params);
    boost::asio::awaitable<nlohmann::json>             read_message();
    boost::asio::awaitable<nlohmann::json>             wait_for_id(int id);
    boost::asio::awaitable<nlohmann::json>             wait_for_event(const std::string& method);

    void check_deadline(const std::string& stage) const;
};

}  // namespace CDP
}  // namespace Browser
}  // namespace Trawl

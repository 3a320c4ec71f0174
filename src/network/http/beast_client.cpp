#include "beast_client.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Trawl {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

constexpr std::uint64_t MAX_BODY_BYTES = 32 * 1024 * 1024;

bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

Response failure(const std::string& url, ErrorType type, const std::string& message) {
    Response response;
    response.effective_url = url;
    response.success       = false;
    response.error         = message;
    response.error_type    = type;
    return response;
}

std::string default_port(const Utils::UrlParsed& target) {
    return target.port.empty() ? Utils::Url::default_port(Utils::Text::to_lower(target.scheme))
                               : target.port;
}

std::string request_target(const Utils::UrlParsed& target) {
    std::string path = target.path.empty() ? "/" : target.path;
    if (!target.query.empty())
        path += "?" + target.query;
    return path;
}

http::request<http::string_body> build_request(const Utils::UrlParsed& target,
                                               http::verb              method,
                                               const std::string&      body,
                                               const RequestOptions&   options) {
    http::request<http::string_body> req{method, request_target(target), 11};
    std::string host_header = target.host;
    if (!target.port.empty() && target.port != Utils::Url::default_port(target.scheme))
        host_header += ":" + target.port;
    req.set(http::field::host, host_header);
    req.set(http::field::user_agent, options.user_agent);
    req.set(http::field::accept, "*/*");
    for (const auto& [name, value] : options.headers) {
        req.set(name, value);
    }
    if (method == http::verb::post) {
        if (!options.content_type.empty())
            req.set(http::field::content_type, options.content_type);
        req.body() = body;
        req.prepare_payload();
    }
    return req;
}

template <typename Stream>
net::awaitable<Response> exchange(Stream&                           stream,
                                  http::request<http::string_body>& req,
                                  const std::string&                effective_url) {
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                       b;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);
    if (req.method() == http::verb::head)
        parser.skip(true);
    co_await http::async_read(stream, b, parser, net::use_awaitable);

    auto&    res = parser.get();
    Response response;
    response.effective_url = effective_url;
    response.status_code   = res.result_int();
    response.body          = std::move(res.body());
    response.success       = (response.status_code >= 200 && response.status_code < 400);
    auto ct                = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    auto loc = res.find(http::field::location);
    if (loc != res.end())
        response.location = std::string(loc->value());
    co_return response;
}

// Resolution runs on a worker thread that cancel() cannot interrupt, so a stuck
// lookup is abandoned at the deadline instead. Whichever of the lookup and the
// timer finishes first completes the handler.
template <typename Handler>
struct ResolveRace {
    ResolveRace(Handler h, const net::any_io_executor& ex)
        : handler(std::move(h)), resolver(ex), timer(ex) {
    }

    // Caller holds mutex.
    void complete(const beast::error_code& ec, tcp::resolver::results_type results) {
        Handler h = std::move(*handler);
        handler.reset();
        auto ex = net::get_associated_executor(h, timer.get_executor());
        net::post(ex, [h = std::move(h), ec, results = std::move(results)]() mutable {
            h(ec, std::move(results));
        });
    }

    std::mutex             mutex;
    std::optional<Handler> handler;
    tcp::resolver          resolver;
    net::steady_timer      timer;
};

template <typename Token>
auto async_resolve_until(const net::any_io_executor&           ex,
                         const std::string&                    host,
                         const std::string&                    port,
                         std::chrono::steady_clock::time_point deadline,
                         Token&&                               token) {
    return net::async_initiate<Token, void(beast::error_code, tcp::resolver::results_type)>(
        [ex, host, port, deadline](auto handler) {
            using Race = ResolveRace<std::decay_t<decltype(handler)>>;
            auto race  = std::make_shared<Race>(std::move(handler), ex);

            std::lock_guard<std::mutex> lock(race->mutex);
            race->timer.expires_at(deadline);
            race->timer.async_wait([race](const beast::error_code& ec) {
                std::lock_guard<std::mutex> lock(race->mutex);
                if (ec || !race->handler)
                    return;
                race->resolver.cancel();
                race->complete(beast::error::timeout, {});
            });
            race->resolver.async_resolve(
                host, port,
                [race](const beast::error_code& ec, tcp::resolver::results_type results) {
                    std::lock_guard<std::mutex> lock(race->mutex);
                    if (!race->handler)
                        return;
                    race->timer.cancel();
                    race->complete(ec, std::move(results));
                });
        },
        token);
}

net::awaitable<tcp::resolver::results_type> resolve(const std::string&                    host,
                                                    const std::string&                    port,
                                                    std::chrono::steady_clock::time_point deadline) {
    if (std::chrono::steady_clock::now() >= deadline)
        throw beast::system_error(beast::error::timeout);
    auto executor = co_await net::this_coro::executor;
    co_return co_await async_resolve_until(executor, host, port, deadline, net::use_awaitable);
}

}  // namespace

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

net::awaitable<Response> BeastClient::get(const std::string& url, const RequestOptions& options) {
    co_return co_await do_request(http::verb::get, url, "", options);
}

net::awaitable<Response> BeastClient::head(const std::string& url, const RequestOptions& options) {
    co_return co_await do_request(http::verb::head, url, "", options);
}

net::awaitable<Response> BeastClient::post(const std::string&    url,
                                           const std::string&    body,
                                           const RequestOptions& options) {
    co_return co_await do_request(http::verb::post, url, body, options);
}

net::awaitable<Response> BeastClient::do_request(http::verb            method,
                                                 const std::string&    url,
                                                 const std::string&    body,
                                                 const RequestOptions& options) {
    const Deadline deadline = std::chrono::steady_clock::now() + options.timeout;
    std::string    current  = url;

    for (int hop = 0;; ++hop) {
        if (!Utils::Url::is_http(current)) {
            co_return failure(current, ErrorType::Network, "Invalid URL");
        }
        auto target = Utils::Url::parse(current);

        Response response;
        try {
            if (Utils::Text::to_lower(target.scheme) == "https")
                response = co_await perform_https_request(target, method, body, options, deadline);
            else
                response = co_await perform_http_request(target, method, body, options, deadline);
        } catch (const beast::system_error& e) {
            if (e.code() == beast::error::timeout)
                co_return failure(current, ErrorType::Timeout, "timeout");
            co_return failure(current, ErrorType::Network, e.code().message());
        } catch (const std::exception& e) {
            co_return failure(current, ErrorType::Network, e.what());
        }
        response.effective_url = current;

        if (options.follow_redirects && method != http::verb::post &&
            is_redirect(response.status_code) && !response.location.empty()) {
            if (hop >= Core::Constants::MAX_REDIRECTS) {
                co_return failure(current, ErrorType::Network, "Too many redirects");
            }
            std::string next = Utils::Url::resolve(current, response.location);
            if (next.empty()) {
                co_return response;
            }
            current = next;
            continue;
        }
        co_return response;
    }
}

net::awaitable<Response> BeastClient::perform_http_request(const Utils::UrlParsed& target,
                                                           http::verb              method,
                                                           const std::string&      body,
                                                           const RequestOptions&   options,
                                                           Deadline                deadline) {
    auto results = co_await resolve(target.host, default_port(target), deadline);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_at(deadline);
    co_await stream.async_connect(results, net::use_awaitable);

    auto     req      = build_request(target, method, body, options);
    Response response = co_await exchange(stream, req, target.start_url);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const Utils::UrlParsed& target,
                                                            http::verb              method,
                                                            const std::string&      body,
                                                            const RequestOptions&   options,
                                                            Deadline                deadline) {
    auto results = co_await resolve(target.host, default_port(target), deadline);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_at(deadline);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    auto     req      = build_request(target, method, body, options);
    Response response = co_await exchange(ssl_stream, req, target.start_url);

    // Servers often drop the connection without close_notify.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof)
        Core::Logger::warn("TLS shutdown for " + target.host + ": " + ec.message());
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Trawl

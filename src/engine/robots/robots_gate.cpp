#include "robots_gate.hpp"
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

RobotsGate::RobotsGate(std::shared_ptr<Network::Http::HttpClient> client,
                       std::chrono::milliseconds                  timeout,
                       std::chrono::seconds                       ttl)
    : client_(std::move(client)), timeout_(timeout), ttl_(ttl) {
}

boost::asio::awaitable<RobotsGate::RobotsPtr>
RobotsGate::fetch_robots_txt(const std::string& origin, const std::string& user_agent) {
    std::string robots_url = origin + "/robots.txt";
    Logger::info("Fetching robots.txt: " + robots_url);

    Network::Http::RequestOptions options;
    options.timeout    = timeout_;
    options.user_agent = user_agent;
    Response res       = co_await client_->get(robots_url, options);

    if (!res.error.empty()) {
        Logger::warn("robots.txt unreachable for " + origin + " (" + res.error +
                     "), allowing all");
        co_return std::make_shared<const Utils::RobotsTxt>(Utils::RobotsTxt::allow_all());
    }
    if (res.status_code >= 200 && res.status_code < 300) {
        co_return std::make_shared<const Utils::RobotsTxt>(Utils::RobotsTxt::parse(res.body));
    }
    if (res.status_code >= 500) {
        Logger::warn("robots.txt for " + origin + " returned " +
                     std::to_string(res.status_code) + ", allowing all");
    }
    else {
        Logger::info("No robots.txt for " + origin + " (" + std::to_string(res.status_code) +
                     ")");
    }
    co_return std::make_shared<const Utils::RobotsTxt>(Utils::RobotsTxt::allow_all());
}

boost::asio::awaitable<RobotsGate::RobotsPtr> RobotsGate::get_robots(const std::string& origin,
                                                                     const std::string& user_agent) {
    std::shared_future<RobotsPtr>           future;
    std::shared_ptr<std::promise<RobotsPtr>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it  = cache_.find(origin);
        auto                        now = std::chrono::steady_clock::now();
        bool                        expired =
            it != cache_.end() && ttl_.count() > 0 && now - it->second.fetched_at >= ttl_ &&
            it->second.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;

        if (it == cache_.end() || expired) {
            promise = std::make_shared<std::promise<RobotsPtr>>();
            future  = promise->get_future().share();
            cache_[origin] = Entry{future, now};
            ++fetch_count_;
        }
        else {
            future = it->second.future;
        }
    }

    if (promise) {
        RobotsPtr robots;
        try {
            robots = co_await fetch_robots_txt(origin, user_agent);
        } catch (const std::exception& e) {
            Logger::warn("robots.txt fetch for " + origin + " failed: " + e.what() +
                         ", allowing all");
            robots = std::make_shared<const Utils::RobotsTxt>(Utils::RobotsTxt::allow_all());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto                        it = cache_.find(origin);
            if (it != cache_.end())
                it->second.fetched_at = std::chrono::steady_clock::now();
        }
        promise->set_value(robots);
        co_return robots;
    }

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        timer.expires_after(std::chrono::milliseconds(Constants::SINGLE_FLIGHT_POLL_MS));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
    co_return future.get();
}

boost::asio::awaitable<bool> RobotsGate::is_allowed(const std::string& url,
                                                    const std::string& user_agent) {
    auto parsed = Utils::Url::parse(url);
    if (parsed.host.empty() || parsed.path == "/robots.txt")
        co_return true;

    auto robots = co_await get_robots(Utils::Url::origin(url), user_agent);
    if (!robots->is_allowed(user_agent, url)) {
        Logger::info("Blocked by robots.txt: " + url);
        co_return false;
    }
    co_return true;
}

boost::asio::awaitable<double> RobotsGate::crawl_delay(const std::string& url,
                                                       const std::string& user_agent) {
    if (Utils::Url::parse(url).host.empty())
        co_return 0.0;
    auto robots = co_await get_robots(Utils::Url::origin(url), user_agent);
    co_return robots->get_crawl_delay(user_agent);
}

std::vector<std::string> RobotsGate::cached_origins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    origins;
    for (const auto& [origin, entry] : cache_) {
        origins.push_back(origin);
    }
    return origins;
}

std::size_t RobotsGate::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

}  // namespace Engine
}  // namespace Trawl

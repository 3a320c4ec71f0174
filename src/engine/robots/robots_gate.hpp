#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../../network/http/http_client.hpp"
#include "../../utils/robotstxt/robotstxt.hpp"

namespace Trawl {
namespace Engine {

class RobotsPolicy {
public:
    virtual ~RobotsPolicy() = default;

    virtual boost::asio::awaitable<bool> is_allowed(const std::string& url,
                                                    const std::string& user_agent) = 0;

    // Crawl-delay for the URL's origin, in seconds.
    virtual boost::asio::awaitable<double> crawl_delay(const std::string& url,
                                                       const std::string& user_agent) = 0;
};

// Process-wide robots.txt cache keyed by origin. Concurrent lookups of an
// uncached origin share one fetch. Unreachable robots.txt (network error,
// timeout, 5xx) is treated as allow-all; a 4xx means no rules.
class RobotsGate : public RobotsPolicy {
public:
    RobotsGate(std::shared_ptr<Network::Http::HttpClient> client,
               std::chrono::milliseconds                  timeout,
               std::chrono::seconds                       ttl = std::chrono::seconds(0));

    boost::asio::awaitable<bool>   is_allowed(const std::string& url,
                                              const std::string& user_agent) override;
    boost::asio::awaitable<double> crawl_delay(const std::string& url,
                                               const std::string& user_agent) override;

    std::vector<std::string> cached_origins() const;
    std::size_t              fetch_count() const;

private:
    using RobotsPtr = std::shared_ptr<const Utils::RobotsTxt>;

    struct Entry {
        std::shared_future<RobotsPtr>         future;
        std::chrono::steady_clock::time_point fetched_at;
    };

    std::shared_ptr<Network::Http::HttpClient> client_;
    std::chrono::milliseconds                  timeout_;
    std::chrono::seconds                       ttl_;

    mutable std::mutex           mutex_;
    std::map<std::string, Entry> cache_;
    std::size_t                  fetch_count_ = 0;

    boost::asio::awaitable<RobotsPtr> get_robots(const std::string& origin,
                                                 const std::string& user_agent);
    boost::asio::awaitable<RobotsPtr> fetch_robots_txt(const std::string& origin,
                                                       const std::string& user_agent);
};

}  // namespace Engine
}  // namespace Trawl

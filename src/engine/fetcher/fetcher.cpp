#include "fetcher.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;
using Network::Http::ErrorType;

namespace {

bool is_retryable(FetchStatus status) {
    return status == FetchStatus::Timeout || status == FetchStatus::NetworkError ||
           status == FetchStatus::RenderError;
}

FetchStatus classify(ErrorType type) {
    switch (type) {
        case ErrorType::Timeout:
            return FetchStatus::Timeout;
        case ErrorType::Render:
            return FetchStatus::RenderError;
        default:
            return FetchStatus::NetworkError;
    }
}

}  // namespace

Fetcher::Fetcher(std::shared_ptr<Render::Renderer>         http_renderer,
                 std::shared_ptr<Render::Renderer>         browser_renderer,
                 std::shared_ptr<RobotsPolicy>             robots,
                 std::shared_ptr<HostThrottle>             throttle,
                 std::shared_ptr<const Extract::Extractor> extractor)
    : http_renderer_(std::move(http_renderer)),
      browser_renderer_(std::move(browser_renderer)),
      robots_(std::move(robots)),
      throttle_(std::move(throttle)),
      extractor_(std::move(extractor)) {
}

Render::Renderer& Fetcher::select_renderer(bool use_browser) const {
    if (use_browser && browser_renderer_)
        return *browser_renderer_;
    return *http_renderer_;
}

void Fetcher::discover_links(FetchOutcome& outcome) const {
    if (!extractor_)
        return;
    try {
        for (auto& link : extractor_->extract_links(outcome.content, outcome.effective_url)) {
            if (!Utils::Url::is_image(link.url))
                outcome.links.push_back(std::move(link.url));
        }
    } catch (const ExtractionError& e) {
        Logger::warn("Link extraction failed for " + outcome.url + ": " + e.what());
    }
}

boost::asio::awaitable<FetchOutcome> Fetcher::fetch(const FrontierEntry& entry,
                                                    const FetchConfig&   config) {
    FetchOutcome outcome;
    outcome.url        = entry.url;
    outcome.fetched_at = Clock::now();
    const auto start   = std::chrono::steady_clock::now();
    auto       stamp   = [&]() {
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    std::chrono::milliseconds delay = config.politeness_delay;
    if (config.respect_robots && robots_) {
        if (!co_await robots_->is_allowed(entry.url, config.render.user_agent)) {
            outcome.status = FetchStatus::BlockedByRobots;
            outcome.error  = "blocked by robots.txt";
            stamp();
            co_return outcome;
        }
        double crawl_delay = co_await robots_->crawl_delay(entry.url, config.render.user_agent);
        delay              = std::max(
            delay, std::chrono::milliseconds(static_cast<long long>(crawl_delay * 1000)));
    }

    const std::string origin    = Utils::Url::origin(entry.url);
    Render::Renderer& renderer  = select_renderer(config.use_browser);
    const int         attempts  = std::max(1, config.max_attempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (throttle_)
            co_await throttle_->wait_turn(origin, delay);

        outcome.attempts = attempt;
        Response res     = co_await renderer.fetch(entry.url, config.render);

        if (res.error_type == ErrorType::Unavailable)
            throw JobInternalError(res.error);

        if (res.error.empty()) {
            outcome.status_code   = res.status_code;
            outcome.effective_url = res.effective_url.empty() ? entry.url : res.effective_url;
            if (res.status_code >= 400) {
                outcome.status = FetchStatus::HttpError;
                outcome.error  = "HTTP " + std::to_string(res.status_code);
                Logger::warn("HTTP " + std::to_string(res.status_code) + " for " + entry.url);
                break;
            }
            outcome.status       = FetchStatus::Ok;
            outcome.error.clear();
            outcome.content      = Utils::Text::sanitize_utf8(res.body);
            outcome.content_type = res.content_type;
            if (config.expand_links && entry.depth < config.max_depth)
                discover_links(outcome);
            break;
        }

        outcome.status = classify(res.error_type);
        outcome.error  = outcome.status == FetchStatus::Timeout ? "timeout" : res.error;
        if (!is_retryable(outcome.status) || res.error_type == ErrorType::Other)
            break;

        if (attempt < attempts) {
            auto backoff = get_backoff_time(attempt, config.backoff_base_ms);
            Logger::warn("Retrying " + entry.url + " in " + std::to_string(backoff.count()) +
                         "ms (" + outcome.error + ")");
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(backoff);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }
    }

    stamp();
    co_return outcome;
}

}  // namespace Engine
}  // namespace Trawl

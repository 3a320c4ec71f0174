#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include "../../core/types/constants.hpp"
#include "../../extract/extractor.hpp"
#include "../../render/renderer.hpp"
#include "../robots/robots_gate.hpp"
#include "../types.hpp"
#include "host_throttle.hpp"

namespace Trawl {
namespace Engine {

struct FetchConfig {
    Render::RenderOptions     render;
    bool                      use_browser    = false;
    bool                      respect_robots = true;
    std::chrono::milliseconds politeness_delay{Core::Constants::DEFAULT_POLITENESS_MS};
    int                       max_attempts    = Core::Constants::MAX_ATTEMPTS;
    int                       backoff_base_ms = Core::Constants::BACKOFF_BASE_MS;
    bool                      expand_links    = false;
    int                       max_depth       = 0;
};

// Fetches one frontier entry: robots check, politeness wait, render, retry.
// Timeouts, network and render failures are retried with exponential backoff;
// HTTP errors are final. Throws Core::JobInternalError if the renderer is unavailable.
class Fetcher {
public:
    Fetcher(std::shared_ptr<Render::Renderer>         http_renderer,
            std::shared_ptr<Render::Renderer>         browser_renderer,
            std::shared_ptr<RobotsPolicy>             robots,
            std::shared_ptr<HostThrottle>             throttle,
            std::shared_ptr<const Extract::Extractor> extractor);

    boost::asio::awaitable<FetchOutcome> fetch(const FrontierEntry& entry, const FetchConfig& config);

private:
    std::shared_ptr<Render::Renderer>         http_renderer_;
    std::shared_ptr<Render::Renderer>         browser_renderer_;
    std::shared_ptr<RobotsPolicy>             robots_;
    std::shared_ptr<HostThrottle>             throttle_;
    std::shared_ptr<const Extract::Extractor> extractor_;

    Render::Renderer& select_renderer(bool use_browser) const;
    void              discover_links(FetchOutcome& outcome) const;
};

}  // namespace Engine
}  // namespace Trawl

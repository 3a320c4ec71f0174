#pragma once
#include <map>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Trawl {
namespace Core {

struct Config {
    // Server
    std::string host           = Constants::DEFAULT_HOST;
    int         port           = Constants::DEFAULT_PORT;
    int         threads        = Constants::DEFAULT_THREADS;
    int         worker_threads = Constants::DEFAULT_WORKER_THREADS;
    std::string config_path;
    std::string log_level = "all";

    // Crawl defaults
    int         pool_size           = Constants::DEFAULT_POOL_SIZE;
    int         max_pool_size       = Constants::MAX_POOL_SIZE;
    int         politeness_delay_ms = Constants::DEFAULT_POLITENESS_MS;
    int         fetch_timeout_ms    = Constants::REQUEST_TIMEOUT_SECONDS * 1000;
    int         robots_timeout_ms   = Constants::ROBOTS_TIMEOUT_SECONDS * 1000;
    int         robots_ttl_seconds  = 0;  // 0 = never refresh
    int         max_attempts        = Constants::MAX_ATTEMPTS;
    int         backoff_ms          = Constants::BACKOFF_BASE_MS;
    bool        respect_robots      = true;
    std::string user_agent          = Constants::USER_AGENT;
    std::string store_dir           = Constants::DEFAULT_STORE_DIR;

    // Browser rendering
    bool        render_js = false;
    std::string browser_path;
    bool        headless = true;
    int         cdp_port = 9222;

    // Agent extraction
    std::string llm_endpoint    = Constants::LLM_ENDPOINT;
    std::string llm_api_key_env = Constants::LLM_API_KEY_ENV;
    std::string llm_model       = Constants::LLM_MODEL;
    // id -> display name, served by /api/models. The default model is always listed.
    std::map<std::string, std::string> llm_models;

    // One-shot mode: run a single job for these URLs instead of serving.
    std::string              mode = "scrape";
    std::vector<std::string> urls;
    std::string              query;
    std::string              instruction;
    int                      depth = -1;  // -1 = mode default

    static Config parse(int argc, char* argv[]);
};

}  // namespace Core
}  // namespace Trawl

#include "config.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Trawl {
namespace Core {

namespace {

template <typename T>
void read_key(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

void validate(Config& config) {
    if (config.threads < 1)
        config.threads = 1;
    if (config.worker_threads < 1)
        config.worker_threads = 1;
    if (config.max_pool_size < 1)
        config.max_pool_size = 1;
    config.pool_size = std::clamp(config.pool_size, 1, config.max_pool_size);
    if (config.max_attempts < 1)
        config.max_attempts = 1;
    if (config.port < 0 || config.port > 65535)
        throw std::runtime_error("Invalid port: " + std::to_string(config.port));
    if (config.fetch_timeout_ms <= 0)
        throw std::runtime_error("fetch_timeout_ms must be positive");
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (!yaml || yaml.IsNull())
            return;

        read_key(yaml, "host", config.host);
        read_key(yaml, "port", config.port);
        read_key(yaml, "threads", config.threads);
        read_key(yaml, "worker_threads", config.worker_threads);
        read_key(yaml, "log_level", config.log_level);

        read_key(yaml, "pool_size", config.pool_size);
        read_key(yaml, "batch_size", config.pool_size);
        read_key(yaml, "max_pool_size", config.max_pool_size);
        read_key(yaml, "politeness_delay_ms", config.politeness_delay_ms);
        read_key(yaml, "fetch_timeout_ms", config.fetch_timeout_ms);
        read_key(yaml, "robots_timeout_ms", config.robots_timeout_ms);
        read_key(yaml, "robots_ttl_seconds", config.robots_ttl_seconds);
        read_key(yaml, "max_attempts", config.max_attempts);
        read_key(yaml, "backoff_ms", config.backoff_ms);
        read_key(yaml, "respect_robots", config.respect_robots);
        read_key(yaml, "user_agent", config.user_agent);
        read_key(yaml, "store_dir", config.store_dir);
        read_key(yaml, "output", config.store_dir);

        read_key(yaml, "render", config.render_js);
        read_key(yaml, "render_js", config.render_js);
        read_key(yaml, "browser_path", config.browser_path);
        read_key(yaml, "headless", config.headless);
        read_key(yaml, "cdp_port", config.cdp_port);

        YAML::Node llm = yaml["llm"];
        if (llm && llm.IsMap()) {
            read_key(llm, "endpoint", config.llm_endpoint);
            read_key(llm, "api_key_env", config.llm_api_key_env);
            read_key(llm, "model", config.llm_model);
            if (llm["models"] && !llm["models"].IsMap())
                throw std::runtime_error("llm.models must map model ids to display names");
            read_key(llm, "models", config.llm_models);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Trawl - Crawl job orchestration service"};

    app.add_option("--host", config.host, "API bind address");
    app.add_option("--port", config.port, "API port");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("--worker-threads", config.worker_threads, "Threads for content extraction");
    app.add_option("--pool-size", config.pool_size, "Default concurrent fetches per job");
    app.add_option("--max-pool-size", config.max_pool_size, "Ceiling for per-job batch_size");
    app.add_option("--delay", config.politeness_delay_ms, "Minimum delay between fetches to one origin (ms)");
    app.add_option("--timeout", config.fetch_timeout_ms, "Per-fetch timeout (ms)");
    app.add_option("--max-attempts", config.max_attempts, "Fetch attempts before giving up on a page");
    app.add_option("--backoff", config.backoff_ms, "Base retry backoff (ms)");
    app.add_option("--user-agent", config.user_agent, "User-Agent for page and robots.txt requests");
    app.add_option("-o,--store", config.store_dir, "Directory for persisted job records");
    app.add_option("--browser", config.browser_path, "Path to Chromium/Chrome executable");
    app.add_option("--cdp-port", config.cdp_port, "Chrome DevTools Protocol port");
    app.add_option("--model", config.llm_model, "Default model for agent jobs");
    app.add_option("--log-level", config.log_level, "all, info, warn, error or none");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_option("-m,--mode", config.mode, "One-shot mode: scrape, crawl, map, search or agent")
        ->check(CLI::IsMember({"scrape", "crawl", "map", "search", "agent"}));
    app.add_option("-d,--depth", config.depth, "One-shot max depth (map/crawl)");
    app.add_option("-q,--query", config.query, "One-shot search query");
    app.add_option("-i,--instruction", config.instruction, "One-shot agent instruction");

    app.add_flag("--render", config.render_js, "Launch a headless browser for use_browser jobs");
    app.add_flag(
        "--no-headless",
        [&](size_t count) {
            if (count > 0)
                config.headless = false;
        },
        "Run browser in windowed mode (debug only)");
    app.add_flag(
        "--ignore-robots",
        [&](size_t count) {
            if (count > 0)
                config.respect_robots = false;
        },
        "Do not consult robots.txt by default");

    app.add_option("urls", config.urls, "URLs for a one-shot job");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    validate(config);
    return config;
}

}  // namespace Core
}  // namespace Trawl

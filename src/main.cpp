#include <cstdlib>
#include <iostream>
#include <memory>
#include "api/api_server.hpp"
#include "browser/launcher/browser_launcher.hpp"
#include "codec/json_codec.hpp"
#include "core/config/config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "core/runtime/runtime.hpp"
#include "engine/job/job_registry.hpp"
#include "extract/html_extractor.hpp"
#include "network/http/beast_client.hpp"
#include "render/browser_renderer.hpp"
#include "render/http_renderer.hpp"
#include "storage/disk_store.hpp"

using namespace Trawl;

namespace {

bool launch_browser_if_needed(const Core::Config& config) {
    if (!config.render_js)
        return true;

    std::string path = config.browser_path;
    if (path.empty())
        path = Browser::Launcher::BrowserLauncher::find_browser();

    if (path.empty()) {
        Core::Logger::error("No Chromium browser found. Use --browser to specify path.");
        return false;
    }
    if (!Browser::Launcher::BrowserLauncher::launch(path, config.cdp_port, config.headless)) {
        Core::Logger::error("Failed to launch headless browser.");
        return false;
    }
    std::atexit(Browser::Launcher::BrowserLauncher::cleanup);
    return true;
}

Engine::JobServices build_services(const Core::Config& config, Core::Runtime& runtime) {
    auto client = std::make_shared<Network::Http::BeastClient>();

    Extract::LlmSettings llm;
    llm.endpoint    = config.llm_endpoint;
    llm.api_key_env = config.llm_api_key_env;
    auto extractor  = std::make_shared<Extract::HtmlExtractor>(
        std::make_shared<Extract::LlmInstructor>(client, llm));

    std::shared_ptr<Render::Renderer> browser;
    if (config.render_js)
        browser = std::make_shared<Render::BrowserRenderer>("127.0.0.1", config.cdp_port);

    auto robots = std::make_shared<Engine::RobotsGate>(
        client, std::chrono::milliseconds(config.robots_timeout_ms),
        std::chrono::seconds(config.robots_ttl_seconds));

    Engine::JobServices services;
    services.runtime   = &runtime;
    services.extractor = extractor;
    services.store     = std::make_shared<Storage::DiskStore>(config.store_dir);
    services.fetcher   = std::make_shared<Engine::Fetcher>(
        std::make_shared<Render::HttpRenderer>(client), browser, robots,
        std::make_shared<Engine::HostThrottle>(), extractor);
    services.defaults = Engine::JobDefaults::from_config(config);
    return services;
}

Engine::JobRequest one_shot_request(const Core::Config& config) {
    Engine::Mode   mode = Engine::parse_mode(config.mode);
    nlohmann::json body = nlohmann::json::object();

    if (mode == Engine::Mode::Crawl)
        body["urls"] = config.urls;
    else
        body["url"] = config.urls.front();
    if (config.depth >= 0)
        body["max_depth"] = config.depth;
    if (!config.query.empty())
        body["query"] = config.query;
    if (!config.instruction.empty())
        body["instruction"] = config.instruction;
    return Codec::request_from_json(mode, body);
}

int run_one_shot(const Core::Config& config, Engine::JobRegistry& registry, Core::Runtime& runtime) {
    std::string id  = registry.submit(one_shot_request(config));
    auto        job = registry.find(id);
    if (!job)
        return 1;

    runtime.on_signal([job](int) { job->cancel(); });

    Engine::JobResult result = job->wait();
    std::cout << Codec::dump(Api::ApiServer::mode_payload(result), 2) << std::endl;
    return result.status == Engine::JobStatus::Failed ? 1 : 0;
}

int run_server(const Core::Config& config, Engine::JobRegistry& registry, Core::Runtime& runtime) {
    Api::ApiServer server(registry, {config.llm_model, Core::Constants::VERSION, config.llm_models});
    if (server.bind(config.host, config.port) < 0) {
        Core::Logger::error("Cannot bind " + config.host + ":" + std::to_string(config.port));
        return 1;
    }

    runtime.on_signal([&server](int) { server.stop(); });

    Core::Logger::success("Trawl " + std::string(Core::Constants::VERSION) + " listening on " +
                          config.host + ":" + std::to_string(config.port));
    server.serve();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
        Core::Logger::set_level(Core::Logger::parse_level(config.log_level));
    } catch (const std::exception& e) {
        Core::Logger::error(std::string("Configuration error: ") + e.what());
        return 1;
    }
    if (!launch_browser_if_needed(config))
        return 1;

    Core::Runtime runtime(config.threads, config.worker_threads);
    runtime.start();

    int code = 0;
    {
        Engine::JobRegistry registry(build_services(config, runtime));
        try {
            code = config.urls.empty() ? run_server(config, registry, runtime)
                                       : run_one_shot(config, registry, runtime);
        } catch (const Core::JobConfigError& e) {
            Core::Logger::error(std::string("Invalid job: ") + e.what());
            code = 2;
        } catch (const std::exception& e) {
            Core::Logger::error(std::string("Fatal: ") + e.what());
            code = 1;
        }
        registry.shutdown(std::chrono::seconds(5));
    }

    runtime.shutdown();
    return code;
}

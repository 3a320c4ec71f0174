#include "api_server.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include "../codec/json_codec.hpp"
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"

namespace Trawl {
namespace Api {

using namespace Trawl::Core;
using namespace Trawl::Engine;
using json = nlohmann::json;

namespace {

constexpr const char* JSON_TYPE   = "application/json";
constexpr const char* NDJSON_TYPE = "application/x-ndjson";

void reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(Codec::dump(body), JSON_TYPE);
}

void reply_error(httplib::Response& res, int status, const std::string& error) {
    reply(res, status, {{"success", false}, {"error", error}});
}

json parse_body(const httplib::Request& req) {
    if (req.body.empty())
        return json::object();
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
        throw JobConfigError("request body must be a JSON object");
    return body;
}

// Non-negative integer query parameter. Throws JobConfigError on anything else.
std::size_t query_count(const httplib::Request& req, const char* name, std::size_t fallback) {
    if (!req.has_param(name))
        return fallback;
    const std::string value = req.get_param_value(name);
    if (value.empty() || value.size() > 9 ||
        value.find_first_not_of("0123456789") != std::string::npos)
        throw JobConfigError(std::string(name) + " must be a non-negative integer");
    return static_cast<std::size_t>(std::stoul(value));
}

const PageResult* first_page(const JobResult& result) {
    return result.pages.empty() ? nullptr : &result.pages.front();
}

json scrape_payload(const JobResult& result) {
    json             j    = {{"url", std::get<ScrapeRequest>(result.request).url}};
    const PageResult* page = first_page(result);
    if (!page || !page->succeeded()) {
        j["success"] = false;
        j["error"]   = page ? page->error : std::string("no page fetched");
        if (page)
            j["status"] = to_string(page->status);
        return j;
    }

    json p      = Codec::to_json(*page);
    j["success"] = true;
    j["format"]  = to_string(page->format);
    j["content"] = page->content.value_or("");
    if (page->format == Format::Markdown)
        j["markdown"] = j["content"];
    for (const char* key : {"metadata", "links", "images", "fields", "links_count"}) {
        if (p.contains(key))
            j[key] = p[key];
    }
    return j;
}

json agent_payload(const JobResult& result) {
    const auto&       request = std::get<AgentRequest>(result.request);
    json              j       = {{"url", request.url}, {"instruction", request.instruction}};
    const PageResult* page    = first_page(result);
    if (!page || !page->succeeded()) {
        j["success"] = false;
        j["error"]   = page ? page->error : std::string("no page fetched");
        return j;
    }
    j["success"]   = true;
    j["extracted"] = page->extracted.value_or(json::object());
    j["metadata"]  = Codec::to_json(*page)["metadata"];
    return j;
}

json search_payload(const JobResult& result) {
    const auto& request = std::get<SearchRequest>(result.request);
    json        j       = {{"url", request.url}, {"query", request.query}};

    const PageResult* page = first_page(result);
    if (!page || !page->succeeded()) {
        j["success"] = false;
        j["error"]   = page ? page->error : std::string("no page fetched");
        return j;
    }
    json results = json::array();
    for (const auto& chunk : page->ranked)
        results.push_back({{"text", chunk.text}, {"score", chunk.score}});
    j["success"]          = true;
    j["results"]          = results;
    j["total_paragraphs"] = page->total_chunks;
    return j;
}

json map_payload(const JobResult& result) {
    const auto& request  = std::get<MapRequest>(result.request);
    json        site_map = json::array();
    for (const auto& page : result.pages) {
        json entry = {{"url", page.url}, {"depth", page.depth}, {"status", to_string(page.status)}};
        if (!page.parent.empty())
            entry["parent"] = page.parent;
        if (page.succeeded()) {
            entry["title"]       = page.metadata.title;
            entry["links_count"] = page.links_count;
            if (page.content)
                entry["content"] = *page.content;
        }
        else {
            entry["error"] = page.error;
        }
        site_map.push_back(std::move(entry));
    }
    return {{"success", true},
            {"root_url", request.url},
            {"max_depth", request.max_depth},
            {"pages_discovered", result.pages.size()},
            {"site_map", site_map},
            {"results", site_map}};
}

json crawl_payload(const JobResult& result) {
    json results = json::array();
    for (const auto& page : result.pages)
        results.push_back(Codec::to_json(page));
    return {{"success", true}, {"total_pages", result.pages.size()}, {"results", results}};
}

}  // namespace

ApiServer::ApiServer(JobRegistry& registry, ApiSettings settings)
    : registry_(registry), settings_(std::move(settings)) {
    register_routes();
}

int ApiServer::bind(const std::string& host, int port) {
    if (port == 0)
        return server_.bind_to_any_port(host);
    return server_.bind_to_port(host, port) ? port : -1;
}

bool ApiServer::serve() {
    return server_.listen_after_bind();
}

void ApiServer::stop() {
    server_.stop();
}

bool ApiServer::is_running() const {
    return server_.is_running();
}

int ApiServer::http_status(const JobResult& result) {
    return result.status == JobStatus::Failed ? 500 : 200;
}

json ApiServer::mode_payload(const JobResult& result) {
    json j;
    if (result.status == JobStatus::Failed) {
        j = {{"success", false}, {"error", result.error}};
    }
    else {
        switch (mode_of(result.request)) {
            case Mode::Scrape:
                j = scrape_payload(result);
                break;
            case Mode::Agent:
                j = agent_payload(result);
                break;
            case Mode::Search:
                j = search_payload(result);
                break;
            case Mode::Map:
                j = map_payload(result);
                break;
            case Mode::Crawl:
                j = crawl_payload(result);
                break;
        }
    }
    j["mode"]   = to_string(mode_of(result.request));
    j["job_id"] = result.id;
    j["status"] = to_string(result.status);
    j["counts"] = Codec::to_json(result.counts);
    return j;
}

void ApiServer::register_routes() {
    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const JobConfigError& e) {
            reply_error(res, 400, e.what());
        } catch (const std::exception& e) {
            Logger::error(req.method + " " + req.path + " failed: " + e.what());
            reply_error(res, 500, e.what());
        }
    });

    server_.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, 200, {{"status", "ok"},
                         {"version", settings_.version},
                         {"jobs", registry_.size()},
                         {"timestamp", Codec::format_time(Clock::now())}});
    });

    server_.Get("/api/modes", [](const httplib::Request&, httplib::Response& res) {
        json modes = json::array({
            {{"name", "scrape"}, {"description", "Extract clean markdown from any URL"}},
            {{"name", "search"}, {"description", "Find content matching a query"}},
            {{"name", "agent"}, {"description", "Instruction-driven data extraction"}},
            {{"name", "map"}, {"description", "Map entire site structure"}},
            {{"name", "crawl"}, {"description", "Batch crawl multiple URLs"}},
        });
        reply(res, 200, {{"modes", modes}});
    });

    server_.Get("/api/models", [this](const httplib::Request&, httplib::Response& res) {
        json models = settings_.models;
        if (!models.contains(settings_.default_model))
            models[settings_.default_model] = "Default model";
        reply(res, 200, {{"default", settings_.default_model}, {"models", models}});
    });

    server_.Post("/api/crawl/stream", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stream(req, res);
    });

    server_.Post(R"(/api/(scrape|crawl|map|search|agent))",
                 [this](const httplib::Request& req, httplib::Response& res) {
                     handle_submit(parse_mode(req.matches[1]), req, res);
                 });

    server_.Get("/api/jobs", [this](const httplib::Request&, httplib::Response& res) {
        handle_list(res);
    });
    server_.Get(R"(/api/jobs/([A-Za-z0-9-]+))",
                [this](const httplib::Request& req, httplib::Response& res) {
                    handle_get_job(req.matches[1], req, res);
                });
    server_.Post(R"(/api/jobs/([A-Za-z0-9-]+)/cancel)",
                 [this](const httplib::Request& req, httplib::Response& res) {
                     handle_cancel(req.matches[1], res);
                 });
    server_.Delete(R"(/api/jobs/([A-Za-z0-9-]+))",
                   [this](const httplib::Request& req, httplib::Response& res) {
                       handle_purge(req.matches[1], res);
                   });
}

void ApiServer::handle_submit(Mode mode, const httplib::Request& req, httplib::Response& res) {
    json body       = parse_body(req);
    bool async      = body.value("async", false);
    JobRequest request = Codec::request_from_json(mode, body);

    std::string id = registry_.submit(std::move(request));
    Logger::info("Accepted " + to_string(mode) + " job " + id);

    if (async) {
        reply(res, 202, {{"success", true}, {"job_id", id}, {"status", "pending"}});
        return;
    }

    auto job = registry_.find(id);
    if (!job) {
        reply_error(res, 404, "job " + id + " was purged before completion");
        return;
    }
    JobResult result = job->wait();
    reply(res, http_status(result), mode_payload(result));
}

void ApiServer::handle_stream(const httplib::Request& req, httplib::Response& res) {
    struct StreamState {
        std::mutex              mutex;
        std::condition_variable cv;
        std::deque<std::string> lines;
    };

    json       body    = parse_body(req);
    JobRequest request = Codec::request_from_json(Mode::Crawl, body);
    auto       state   = std::make_shared<StreamState>();

    std::string id = registry_.submit(std::move(request), [state](const PageResult& page) {
        std::string line = Codec::dump(Codec::to_json(page)) + "\n";
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->lines.push_back(std::move(line));
        }
        state->cv.notify_one();
    });
    auto job = registry_.find(id);
    if (!job) {
        reply_error(res, 404, "job " + id + " was purged before streaming");
        return;
    }

    res.set_header("X-Job-Id", id);
    res.set_chunked_content_provider(
        NDJSON_TYPE, [state, job](std::size_t, httplib::DataSink& sink) {
            std::deque<std::string> ready;
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                state->cv.wait_for(lock, std::chrono::milliseconds(100),
                                   [&] { return !state->lines.empty(); });
                ready.swap(state->lines);
            }
            for (const auto& line : ready) {
                if (!sink.write(line.data(), line.size())) {
                    job->cancel();
                    return false;
                }
            }

            if (!is_terminal(job->state()))
                return true;

            // Pages recorded between the last drain and the terminal transition.
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                ready.swap(state->lines);
            }
            for (const auto& line : ready) {
                if (!sink.write(line.data(), line.size()))
                    return false;
            }

            JobResult result  = job->status();
            json      summary = {{"done", true},
                                 {"job_id", result.id},
                                 {"status", to_string(result.status)},
                                 {"counts", Codec::to_json(result.counts)}};
            if (!result.error.empty())
                summary["error"] = result.error;
            std::string line = Codec::dump(summary) + "\n";
            if (!sink.write(line.data(), line.size()))
                return false;
            sink.done();
            return true;
        });
}

void ApiServer::handle_get_job(const std::string&      id,
                               const httplib::Request& req,
                               httplib::Response&      res) {
    std::size_t limit  = query_count(req, "limit", Constants::DEFAULT_RESULTS_LIMIT);
    std::size_t offset = query_count(req, "offset", 0);

    auto result = registry_.status(id);
    if (!result) {
        reply_error(res, 404, "unknown job " + id);
        return;
    }

    std::size_t total = result->pages.size();
    std::size_t first = std::min(offset, total);
    std::size_t last  = first + std::min(limit, total - first);
    result->pages     = std::vector<PageResult>(result->pages.begin() + first,
                                                result->pages.begin() + last);

    json j           = Codec::to_json(*result);
    j["success"]     = result->status != JobStatus::Failed;
    j["total_pages"] = total;
    j["limit"]       = limit;
    j["offset"]      = offset;
    reply(res, 200, j);
}

void ApiServer::handle_cancel(const std::string& id, httplib::Response& res) {
    if (!registry_.cancel(id)) {
        reply_error(res, 404, "unknown job " + id);
        return;
    }
    auto result = registry_.status(id);
    reply(res, 200, {{"success", true},
                     {"job_id", id},
                     {"status", result ? to_string(result->status) : std::string("cancelled")}});
}

void ApiServer::handle_purge(const std::string& id, httplib::Response& res) {
    switch (registry_.purge(id)) {
        case PurgeResult::Purged:
            reply(res, 200, {{"success", true}, {"job_id", id}});
            return;
        case PurgeResult::NotFound:
            reply_error(res, 404, "unknown job " + id);
            return;
        case PurgeResult::Running:
            reply_error(res, 409, "job " + id + " is still running; cancel it first");
            return;
    }
}

void ApiServer::handle_list(httplib::Response& res) {
    json jobs = json::array();
    for (const auto& result : registry_.list())
        jobs.push_back(Codec::summary_json(result));
    reply(res, 200, {{"success", true}, {"jobs", jobs}});
}

}  // namespace Api
}  // namespace Trawl

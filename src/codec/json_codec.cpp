#include "json_codec.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "../core/errors/errors.hpp"

namespace Trawl {
namespace Codec {

using namespace Trawl::Engine;
using nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename T>
void read_field(const json& body, const char* key, T& target) {
    auto it = body.find(key);
    if (it != body.end() && !it->is_null())
        target = it->template get<T>();
}

json options_json(const FetchSettings& o) {
    json j = {{"format", to_string(o.format)},
              {"use_browser", o.use_browser},
              {"include_links", o.include_links},
              {"include_images", o.include_images},
              {"delay_ms", o.delay_ms}};
    if (o.respect_robots)
        j["respect_robots"] = *o.respect_robots;
    if (!o.user_agent.empty())
        j["user_agent"] = o.user_agent;
    return j;
}

void read_options(const json& body, FetchSettings& o) {
    if (body.contains("format") && !body["format"].is_null())
        o.format = parse_format(body["format"].get<std::string>());
    read_field(body, "use_browser", o.use_browser);
    read_field(body, "include_links", o.include_links);
    read_field(body, "include_images", o.include_images);
    read_field(body, "delay_ms", o.delay_ms);
    if (body.contains("respect_robots") && !body["respect_robots"].is_null())
        o.respect_robots = body["respect_robots"].get<bool>();
    read_field(body, "user_agent", o.user_agent);
}

json scope_json(const std::vector<ScopeRule>& scope) {
    json rules = json::array();
    for (const auto& rule : scope) {
        rules.push_back({{"type", rule.type == ScopeRule::Type::Allow ? "allow" : "deny"},
                         {"pattern", rule.pattern}});
    }
    return rules;
}

std::vector<ScopeRule> read_scope(const json& body) {
    std::vector<ScopeRule> scope;
    if (!body.contains("scope") || body["scope"].is_null())
        return scope;
    for (const auto& r : body["scope"]) {
        ScopeRule   rule;
        std::string type = r.at("type").get<std::string>();
        if (type == "allow")
            rule.type = ScopeRule::Type::Allow;
        else if (type == "deny")
            rule.type = ScopeRule::Type::Deny;
        else
            throw Core::JobConfigError("scope rule type must be allow or deny: " + type);
        rule.pattern = r.at("pattern").get<std::string>();
        scope.push_back(rule);
    }
    return scope;
}

json selectors_json(const std::vector<SelectorSpec>& selectors) {
    json out = json::array();
    for (const auto& s : selectors) {
        json j = {{"name", s.name}, {"selector", s.selector}};
        if (!s.attr.empty())
            j["attr"] = s.attr;
        out.push_back(j);
    }
    return out;
}

std::vector<SelectorSpec> read_selectors(const json& body) {
    std::vector<SelectorSpec> selectors;
    if (!body.contains("selectors") || body["selectors"].is_null())
        return selectors;
    for (const auto& s : body["selectors"]) {
        SelectorSpec spec;
        spec.name     = s.at("name").get<std::string>();
        spec.selector = s.at("selector").get<std::string>();
        read_field(s, "attr", spec.attr);
        selectors.push_back(spec);
    }
    return selectors;
}

json metadata_json(const PageMetadata& m) {
    return {{"title", m.title},
            {"description", m.description},
            {"author", m.author},
            {"keywords", m.keywords},
            {"favicon", m.favicon}};
}

PageMetadata read_metadata(const json& j) {
    PageMetadata m;
    read_field(j, "title", m.title);
    read_field(j, "description", m.description);
    read_field(j, "author", m.author);
    read_field(j, "keywords", m.keywords);
    read_field(j, "favicon", m.favicon);
    return m;
}

}  // namespace

std::string format_time(Timestamp ts) {
    auto        ms   = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch());
    std::time_t secs = static_cast<std::time_t>(ms.count() / 1000);
    std::tm     tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (ms.count() % 1000) << 'Z';
    return out.str();
}

Timestamp parse_time(const std::string& text) {
    std::tm            tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        throw std::runtime_error("invalid timestamp: " + text);
    long millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek()))
            digits += static_cast<char>(in.get());
        digits = (digits + "000").substr(0, 3);
        millis = std::stol(digits);
    }
    auto secs = timegm(&tm);
    return Timestamp(std::chrono::seconds(secs)) + std::chrono::milliseconds(millis);
}

json to_json(const JobRequest& request) {
    json j = std::visit(
        overloaded{[](const ScrapeRequest& r) {
                       json o   = options_json(r.options);
                       o["url"] = r.url;
                       return o;
                   },
                   [](const CrawlRequest& r) {
                       json o                    = options_json(r.options);
                       o["urls"]                 = r.urls;
                       o["batch_size"]           = r.batch_size;
                       o["max_depth"]            = r.max_depth;
                       o["max_pages"]            = r.max_pages;
                       o["same_domain"]          = r.same_domain;
                       o["scope"]                = scope_json(r.scope);
                       o["selectors"]            = selectors_json(r.selectors);
                       o["max_duration_seconds"] = r.max_duration_seconds;
                       return o;
                   },
                   [](const MapRequest& r) {
                       json o               = options_json(r.options);
                       o["url"]             = r.url;
                       o["max_depth"]       = r.max_depth;
                       o["max_pages"]       = r.max_pages;
                       o["same_domain"]     = r.same_domain;
                       o["batch_size"]      = r.batch_size;
                       o["include_content"] = r.include_content;
                       o["scope"]           = scope_json(r.scope);
                       return o;
                   },
                   [](const SearchRequest& r) {
                       json o     = options_json(r.options);
                       o["url"]   = r.url;
                       o["query"] = r.query;
                       o["top_k"] = r.top_k;
                       return o;
                   },
                   [](const AgentRequest& r) {
                       json o           = options_json(r.options);
                       o["url"]         = r.url;
                       o["instruction"] = r.instruction;
                       o["model"]       = r.model;
                       return o;
                   }},
        request);
    j["mode"] = to_string(mode_of(request));
    return j;
}

JobRequest request_from_json(Mode mode, const json& body) {
    if (!body.is_object())
        throw Core::JobConfigError("request body must be a JSON object");
    try {
        switch (mode) {
            case Mode::Scrape: {
                ScrapeRequest r;
                read_field(body, "url", r.url);
                read_options(body, r.options);
                return r;
            }
            case Mode::Crawl: {
                CrawlRequest r;
                read_field(body, "urls", r.urls);
                if (r.urls.empty() && body.contains("url"))
                    r.urls.push_back(body["url"].get<std::string>());
                read_options(body, r.options);
                read_field(body, "batch_size", r.batch_size);
                read_field(body, "max_depth", r.max_depth);
                read_field(body, "max_pages", r.max_pages);
                read_field(body, "same_domain", r.same_domain);
                read_field(body, "max_duration_seconds", r.max_duration_seconds);
                r.scope     = read_scope(body);
                r.selectors = read_selectors(body);
                return r;
            }
            case Mode::Map: {
                MapRequest r;
                read_field(body, "url", r.url);
                read_options(body, r.options);
                read_field(body, "max_depth", r.max_depth);
                read_field(body, "max_pages", r.max_pages);
                read_field(body, "same_domain", r.same_domain);
                read_field(body, "batch_size", r.batch_size);
                read_field(body, "include_content", r.include_content);
                r.scope = read_scope(body);
                return r;
            }
            case Mode::Search: {
                SearchRequest r;
                read_field(body, "url", r.url);
                read_options(body, r.options);
                read_field(body, "query", r.query);
                read_field(body, "top_k", r.top_k);
                return r;
            }
            case Mode::Agent: {
                AgentRequest r;
                read_field(body, "url", r.url);
                read_options(body, r.options);
                read_field(body, "instruction", r.instruction);
                read_field(body, "model", r.model);
                return r;
            }
        }
    } catch (const json::exception& e) {
        throw Core::JobConfigError(std::string("malformed request: ") + e.what());
    }
    throw Core::JobConfigError("unsupported mode");
}

JobRequest request_from_json(const json& body) {
    if (!body.is_object() || !body.contains("mode") || !body["mode"].is_string())
        throw Core::JobConfigError("request needs a mode");
    return request_from_json(parse_mode(body["mode"].get<std::string>()), body);
}

json to_json(const PageResult& page) {
    json j = {{"url", page.url},
              {"depth", page.depth},
              {"parent", page.parent},
              {"sequence", page.sequence},
              {"status", to_string(page.status)},
              {"status_code", page.status_code},
              {"attempts", page.attempts},
              {"fetched_at", format_time(page.fetched_at)},
              {"elapsed_ms", page.elapsed.count()},
              {"success", page.succeeded()}};

    if (page.content) {
        j["content"] = *page.content;
        j["format"]  = to_string(page.format);
    }
    if (page.status == FetchStatus::Ok) {
        j["metadata"]    = metadata_json(page.metadata);
        j["links_count"] = page.links_count;
    }
    if (!page.links.empty()) {
        json links = json::array();
        for (const auto& l : page.links)
            links.push_back({{"url", l.url}, {"text", l.text}});
        j["links"] = links;
    }
    if (!page.images.empty()) {
        json images = json::array();
        for (const auto& img : page.images)
            images.push_back({{"src", img.src}, {"alt", img.alt}, {"title", img.title}});
        j["images"] = images;
    }
    if (!page.fields.empty())
        j["fields"] = page.fields;
    if (!page.ranked.empty() || page.total_chunks > 0) {
        json ranked = json::array();
        for (const auto& c : page.ranked)
            ranked.push_back({{"text", c.text}, {"score", c.score}});
        j["ranked"]       = ranked;
        j["total_chunks"] = page.total_chunks;
    }
    if (page.extracted)
        j["extracted"] = *page.extracted;
    if (!page.error.empty())
        j["error"] = page.error;
    return j;
}

json to_json(const PageCounts& counts) {
    return {{"attempted", counts.attempted},
            {"succeeded", counts.succeeded},
            {"failed", counts.failed},
            {"skipped_by_robots", counts.skipped_by_robots}};
}

json to_json(const JobResult& result) {
    json pages = json::array();
    for (const auto& page : result.pages)
        pages.push_back(to_json(page));

    json j = {{"id", result.id},
              {"mode", to_string(mode_of(result.request))},
              {"request", to_json(result.request)},
              {"status", to_string(result.status)},
              {"counts", to_json(result.counts)},
              {"pages", pages},
              {"created_at", format_time(result.created_at)}};
    if (!result.error.empty())
        j["error"] = result.error;
    if (result.completed_at)
        j["completed_at"] = format_time(*result.completed_at);
    return j;
}

JobResult result_from_json(const json& j) {
    try {
        JobResult result;
        result.id         = j.at("id").get<std::string>();
        result.request    = request_from_json(j.at("request"));
        result.status     = parse_job_status(j.at("status").get<std::string>());
        result.created_at = parse_time(j.at("created_at").get<std::string>());
        if (j.contains("completed_at"))
            result.completed_at = parse_time(j["completed_at"].get<std::string>());
        read_field(j, "error", result.error);

        const auto& c                   = j.at("counts");
        result.counts.attempted         = c.at("attempted").get<std::size_t>();
        result.counts.succeeded         = c.at("succeeded").get<std::size_t>();
        result.counts.failed            = c.at("failed").get<std::size_t>();
        result.counts.skipped_by_robots = c.at("skipped_by_robots").get<std::size_t>();

        for (const auto& p : j.at("pages")) {
            PageResult page;
            page.url         = p.at("url").get<std::string>();
            page.depth       = p.at("depth").get<int>();
            page.parent      = p.value("parent", "");
            page.sequence    = p.at("sequence").get<std::uint64_t>();
            page.status      = parse_fetch_status(p.at("status").get<std::string>());
            page.status_code = p.value("status_code", 0L);
            page.attempts    = p.value("attempts", 0);
            page.fetched_at  = parse_time(p.at("fetched_at").get<std::string>());
            page.elapsed     = std::chrono::milliseconds(p.value("elapsed_ms", 0LL));
            if (p.contains("content")) {
                page.content = p["content"].get<std::string>();
                page.format  = parse_format(p.value("format", "markdown"));
            }
            if (p.contains("metadata"))
                page.metadata = read_metadata(p["metadata"]);
            page.links_count = p.value("links_count", std::size_t{0});
            if (p.contains("links")) {
                for (const auto& l : p["links"])
                    page.links.push_back({l.value("url", ""), l.value("text", "")});
            }
            if (p.contains("images")) {
                for (const auto& img : p["images"])
                    page.images.push_back(
                        {img.value("src", ""), img.value("alt", ""), img.value("title", "")});
            }
            if (p.contains("fields"))
                page.fields = p["fields"].get<std::map<std::string, std::vector<std::string>>>();
            if (p.contains("ranked")) {
                for (const auto& c : p["ranked"])
                    page.ranked.push_back({c.value("text", ""), c.value("score", 0.0)});
                page.total_chunks = p.value("total_chunks", std::size_t{0});
            }
            if (p.contains("extracted"))
                page.extracted = p["extracted"];
            page.error = p.value("error", "");
            result.pages.push_back(std::move(page));
        }
        return result;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed job record: ") + e.what());
    } catch (const Core::JobConfigError& e) {
        throw std::runtime_error(std::string("malformed job request in record: ") + e.what());
    }
}

json summary_json(const JobResult& result) {
    json j = {{"id", result.id},
              {"mode", to_string(mode_of(result.request))},
              {"status", to_string(result.status)},
              {"counts", to_json(result.counts)},
              {"created_at", format_time(result.created_at)}};
    if (result.completed_at)
        j["completed_at"] = format_time(*result.completed_at);
    if (!result.error.empty())
        j["error"] = result.error;
    return j;
}

std::string dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace Codec
}  // namespace Trawl

#include "job_request.hpp"
#include <regex>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Engine {

using Core::JobConfigError;
using Core::Logger;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void check_url(const std::string& url) {
    if (Utils::Text::trim(url).empty())
        throw JobConfigError("url must not be empty");
    if (!Utils::Url::is_http(url))
        throw JobConfigError("url must be http(s): " + url);
}

void check_non_negative(int value, const std::string& name) {
    if (value < 0)
        throw JobConfigError(name + " must not be negative");
}

void check_batch(int& batch_size, int max_pool_size) {
    if (batch_size <= 0)
        throw JobConfigError("batch_size must be positive");
    if (batch_size > max_pool_size) {
        Logger::warn("batch_size " + std::to_string(batch_size) + " clamped to " +
                     std::to_string(max_pool_size));
        batch_size = max_pool_size;
    }
}

void check_scope(const std::vector<ScopeRule>& scope) {
    for (const auto& rule : scope) {
        try {
            std::regex re(rule.pattern);
        } catch (const std::regex_error& e) {
            throw JobConfigError("invalid scope pattern '" + rule.pattern + "': " + e.what());
        }
    }
}

void check_options(const FetchSettings& options) {
    check_non_negative(options.delay_ms, "delay_ms");
    if (options.user_agent.find_first_of("\r\n") != std::string::npos)
        throw JobConfigError("user_agent must be a single line");
}

}  // namespace

std::string to_string(Mode mode) {
    switch (mode) {
        case Mode::Scrape:
            return "scrape";
        case Mode::Crawl:
            return "crawl";
        case Mode::Map:
            return "map";
        case Mode::Search:
            return "search";
        case Mode::Agent:
            return "agent";
    }
    return "scrape";
}

std::string to_string(Format format) {
    switch (format) {
        case Format::Markdown:
            return "markdown";
        case Format::Text:
            return "text";
        case Format::Html:
            return "html";
    }
    return "markdown";
}

Mode parse_mode(const std::string& name) {
    std::string n = Utils::Text::to_lower(name);
    if (n == "scrape")
        return Mode::Scrape;
    if (n == "crawl")
        return Mode::Crawl;
    if (n == "map")
        return Mode::Map;
    if (n == "search")
        return Mode::Search;
    if (n == "agent")
        return Mode::Agent;
    throw JobConfigError("unknown mode: " + name);
}

Format parse_format(const std::string& name) {
    std::string n = Utils::Text::to_lower(name);
    if (n == "markdown" || n == "md")
        return Format::Markdown;
    if (n == "text")
        return Format::Text;
    if (n == "html")
        return Format::Html;
    throw JobConfigError("unknown format: " + name);
}

Mode mode_of(const JobRequest& request) {
    return std::visit(overloaded{[](const ScrapeRequest&) { return Mode::Scrape; },
                                 [](const CrawlRequest&) { return Mode::Crawl; },
                                 [](const MapRequest&) { return Mode::Map; },
                                 [](const SearchRequest&) { return Mode::Search; },
                                 [](const AgentRequest&) { return Mode::Agent; }},
                      request);
}

void validate(JobRequest& request, int max_pool_size) {
    std::visit(overloaded{[](ScrapeRequest& r) {
                              check_url(r.url);
                              check_options(r.options);
                          },
                          [&](CrawlRequest& r) {
                              if (r.urls.empty())
                                  throw JobConfigError("urls must not be empty");
                              for (const auto& url : r.urls)
                                  check_url(url);
                              check_options(r.options);
                              check_non_negative(r.max_depth, "max_depth");
                              check_non_negative(r.max_pages, "max_pages");
                              check_non_negative(r.max_duration_seconds, "max_duration");
                              check_batch(r.batch_size, max_pool_size);
                              check_scope(r.scope);
                              for (const auto& s : r.selectors) {
                                  if (s.name.empty() || s.selector.empty())
                                      throw JobConfigError("selector needs a name and a selector");
                              }
                          },
                          [&](MapRequest& r) {
                              check_url(r.url);
                              check_options(r.options);
                              check_non_negative(r.max_depth, "max_depth");
                              check_non_negative(r.max_pages, "max_pages");
                              check_batch(r.batch_size, max_pool_size);
                              check_scope(r.scope);
                          },
                          [](SearchRequest& r) {
                              check_url(r.url);
                              check_options(r.options);
                              if (Utils::Text::trim(r.query).empty())
                                  throw JobConfigError("query must not be empty");
                              if (r.top_k <= 0)
                                  throw JobConfigError("top_k must be positive");
                          },
                          [](AgentRequest& r) {
                              check_url(r.url);
                              check_options(r.options);
                              if (Utils::Text::trim(r.instruction).empty())
                                  throw JobConfigError("instruction must not be empty");
                          }},
               request);
}

JobPlan make_plan(const JobRequest& request, const std::string& default_model) {
    JobPlan plan;
    plan.mode = mode_of(request);
    std::visit(overloaded{[&](const ScrapeRequest& r) {
                              plan.seeds   = {r.url};
                              plan.options = r.options;
                          },
                          [&](const CrawlRequest& r) {
                              plan.seeds        = r.urls;
                              plan.options      = r.options;
                              plan.pool_size    = r.batch_size;
                              plan.max_depth    = r.max_depth;
                              plan.max_pages    = r.max_pages;
                              plan.same_domain  = r.same_domain;
                              plan.expand_links = r.max_depth > 0;
                              plan.scope        = r.scope;
                              plan.selectors    = r.selectors;
                              plan.max_duration = std::chrono::seconds(r.max_duration_seconds);
                          },
                          [&](const MapRequest& r) {
                              plan.seeds           = {r.url};
                              plan.options         = r.options;
                              plan.pool_size       = r.batch_size;
                              plan.max_depth       = r.max_depth;
                              plan.max_pages       = r.max_pages;
                              plan.same_domain     = r.same_domain;
                              plan.expand_links    = r.max_depth > 0;
                              plan.include_content = r.include_content;
                              plan.scope           = r.scope;
                          },
                          [&](const SearchRequest& r) {
                              plan.seeds   = {r.url};
                              plan.options = r.options;
                              plan.query   = r.query;
                              plan.top_k   = r.top_k;
                          },
                          [&](const AgentRequest& r) {
                              plan.seeds       = {r.url};
                              plan.options     = r.options;
                              plan.instruction = r.instruction;
                              plan.model       = r.model.empty() ? default_model : r.model;
                          }},
               request);
    return plan;
}

}  // namespace Engine
}  // namespace Trawl

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Trawl {
namespace Engine {

enum class Mode { Scrape, Crawl, Map, Search, Agent };
enum class Format { Markdown, Text, Html };

std::string to_string(Mode mode);
std::string to_string(Format format);

// Throws Core::JobConfigError on unknown names.
Mode   parse_mode(const std::string& name);
Format parse_format(const std::string& name);

struct ScopeRule {
    enum class Type { Allow, Deny };
    Type        type = Type::Allow;
    std::string pattern;
};

// Values collected under `name`: the text of each matched element, or the
// value of `attr` when set.
struct SelectorSpec {
    std::string name;
    std::string selector;
    std::string attr;
};

struct FetchSettings {
    Format              format         = Format::Markdown;
    bool                use_browser    = false;
    bool                include_links  = false;
    bool                include_images = false;
    std::optional<bool> respect_robots;
    int                 delay_ms = 0;
    std::string         user_agent;  // empty = configured default
};

struct ScrapeRequest {
    std::string   url;
    FetchSettings options;
};

struct CrawlRequest {
    std::vector<std::string>  urls;
    FetchSettings             options;
    int                       batch_size  = 5;
    int                       max_depth   = 0;
    int                       max_pages   = 0;  // 0 = unlimited
    bool                      same_domain = true;
    std::vector<ScopeRule>    scope;
    std::vector<SelectorSpec> selectors;
    int                       max_duration_seconds = 0;  // 0 = none
};

struct MapRequest {
    std::string            url;
    FetchSettings          options;
    int                    max_depth       = 2;
    int                    max_pages       = 50;
    bool                   same_domain     = true;
    int                    batch_size      = 3;
    bool                   include_content = false;
    std::vector<ScopeRule> scope;
};

struct SearchRequest {
    std::string   url;
    FetchSettings options{.use_browser = true};
    std::string   query;
    int           top_k = 5;
};

struct AgentRequest {
    std::string   url;
    FetchSettings options{.use_browser = true};
    std::string   instruction;
    std::string   model;  // empty = configured default
};

using JobRequest = std::variant<ScrapeRequest, CrawlRequest, MapRequest, SearchRequest, AgentRequest>;

Mode mode_of(const JobRequest& request);

// Rejects malformed requests with Core::JobConfigError. A batch_size above
// max_pool_size is clamped with a warning.
void validate(JobRequest& request, int max_pool_size);

// Mode-independent description of how a job runs.
struct JobPlan {
    Mode                      mode = Mode::Scrape;
    std::vector<std::string>  seeds;
    FetchSettings             options;
    int                       pool_size       = 1;
    int                       max_depth       = 0;
    int                       max_pages       = 0;
    bool                      same_domain     = true;
    bool                      expand_links    = false;
    bool                      include_content = true;
    std::vector<ScopeRule>    scope;
    std::vector<SelectorSpec> selectors;
    std::chrono::seconds      max_duration{0};
    std::string               query;
    int                       top_k = 0;
    std::string               instruction;
    std::string               model;
};

JobPlan make_plan(const JobRequest& request, const std::string& default_model);

}  // namespace Engine
}  // namespace Trawl

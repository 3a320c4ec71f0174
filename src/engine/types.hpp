#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "request/job_request.hpp"

namespace Trawl {
namespace Engine {

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;

struct FrontierEntry {
    std::string   url;
    int           depth = 0;
    std::string   parent;
    std::uint64_t sequence = 0;
};

enum class FetchStatus { Ok, HttpError, Timeout, NetworkError, BlockedByRobots, RenderError };

std::string to_string(FetchStatus status);
FetchStatus parse_fetch_status(const std::string& name);

struct FetchOutcome {
    std::string               url;
    FetchStatus               status      = FetchStatus::Ok;
    long                      status_code = 0;
    std::string               content;
    std::string               content_type;
    std::string               effective_url;
    std::vector<std::string>  links;
    std::string               error;
    int                       attempts = 0;
    Timestamp                 fetched_at;
    std::chrono::milliseconds elapsed{0};

    bool ok() const {
        return status == FetchStatus::Ok;
    }
};

struct PageMetadata {
    std::string title;
    std::string description;
    std::string author;
    std::string keywords;
    std::string favicon;
};

struct Link {
    std::string url;
    std::string text;
};

struct Image {
    std::string src;
    std::string alt;
    std::string title;
};

struct RankedChunk {
    std::string text;
    double      score = 0.0;
};

struct PageResult {
    std::string               url;
    int                       depth = 0;
    std::string               parent;
    std::uint64_t             sequence    = 0;
    FetchStatus               status      = FetchStatus::Ok;
    long                      status_code = 0;
    int                       attempts    = 0;
    Timestamp                 fetched_at;
    std::chrono::milliseconds elapsed{0};

    std::optional<std::string>                      content;
    Format                                          format = Format::Markdown;
    PageMetadata                                    metadata;
    std::size_t                                     links_count = 0;
    std::vector<Link>                               links;
    std::vector<Image>                              images;
    std::map<std::string, std::vector<std::string>> fields;
    std::vector<RankedChunk>                        ranked;
    std::size_t                                     total_chunks = 0;
    std::optional<nlohmann::json>                   extracted;
    std::string                                     error;

    // Fetch ok and extraction did not fail.
    bool succeeded() const {
        return status == FetchStatus::Ok && error.empty();
    }
};

struct PageCounts {
    std::size_t attempted         = 0;
    std::size_t succeeded         = 0;
    std::size_t failed            = 0;
    std::size_t skipped_by_robots = 0;
};

enum class JobStatus { Pending, Running, Completed, Failed, Cancelled };

std::string to_string(JobStatus status);
JobStatus   parse_job_status(const std::string& name);
bool        is_terminal(JobStatus status);

struct JobResult {
    std::string              id;
    JobRequest               request;
    JobStatus                status = JobStatus::Pending;
    PageCounts               counts;
    std::vector<PageResult>  pages;  // ordered by (depth, sequence)
    std::string              error;
    Timestamp                created_at;
    std::optional<Timestamp> completed_at;
};

}  // namespace Engine
}  // namespace Trawl

#include "types.hpp"
#include <stdexcept>

namespace Trawl {
namespace Engine {

std::string to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok:
            return "ok";
        case FetchStatus::HttpError:
            return "http_error";
        case FetchStatus::Timeout:
            return "timeout";
        case FetchStatus::NetworkError:
            return "network_error";
        case FetchStatus::BlockedByRobots:
            return "blocked_by_robots";
        case FetchStatus::RenderError:
            return "render_error";
    }
    return "ok";
}

FetchStatus parse_fetch_status(const std::string& name) {
    if (name == "ok")
        return FetchStatus::Ok;
    if (name == "http_error")
        return FetchStatus::HttpError;
    if (name == "timeout")
        return FetchStatus::Timeout;
    if (name == "network_error")
        return FetchStatus::NetworkError;
    if (name == "blocked_by_robots")
        return FetchStatus::BlockedByRobots;
    if (name == "render_error")
        return FetchStatus::RenderError;
    throw std::runtime_error("unknown fetch status: " + name);
}

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
        case JobStatus::Cancelled:
            return "cancelled";
    }
    return "pending";
}

JobStatus parse_job_status(const std::string& name) {
    if (name == "pending")
        return JobStatus::Pending;
    if (name == "running")
        return JobStatus::Running;
    if (name == "completed")
        return JobStatus::Completed;
    if (name == "failed")
        return JobStatus::Failed;
    if (name == "cancelled")
        return JobStatus::Cancelled;
    throw std::runtime_error("unknown job status: " + name);
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

}  // namespace Engine
}  // namespace Trawl

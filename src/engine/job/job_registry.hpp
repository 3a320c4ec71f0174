#pragma once
#include <boost/uuid/random_generator.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "job_coordinator.hpp"

namespace Trawl {
namespace Engine {

enum class PurgeResult { Purged, NotFound, Running };

// Process-wide table of jobs. Owned by main; finished jobs stay until purged
// and are looked up in the Store once they are no longer in memory.
class JobRegistry {
public:
    explicit JobRegistry(JobServices services);
    ~JobRegistry();

    JobRegistry(const JobRegistry&)            = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // Validates, creates and starts a job. Throws Core::JobConfigError.
    std::string submit(JobRequest request, JobCoordinator::PageCallback on_page = nullptr);

    std::shared_ptr<JobCoordinator> find(const std::string& id) const;
    std::optional<JobResult>        status(const std::string& id) const;
    bool                            cancel(const std::string& id);
    PurgeResult                     purge(const std::string& id);
    std::vector<JobResult>          list() const;

    // Cancels every job and waits up to `timeout` for each to settle.
    void shutdown(std::chrono::milliseconds timeout);

    std::size_t size() const;

private:
    JobServices services_;

    mutable std::mutex                                      mutex_;
    std::map<std::string, std::shared_ptr<JobCoordinator>> jobs_;
    boost::uuids::random_generator                          generator_;
    bool                                                    shutting_down_ = false;
};

}  // namespace Engine
}  // namespace Trawl

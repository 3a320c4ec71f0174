#include "job_registry.hpp"
#include <algorithm>
#include <boost/uuid/uuid_io.hpp>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

JobRegistry::JobRegistry(JobServices services) : services_(std::move(services)) {
}

JobRegistry::~JobRegistry() {
    shutdown(std::chrono::seconds(5));
}

std::string JobRegistry::submit(JobRequest request, JobCoordinator::PageCallback on_page) {
    validate(request, services_.defaults.max_pool_size);

    std::shared_ptr<JobCoordinator> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_)
            throw JobInternalError("service is shutting down");

        std::string id = boost::uuids::to_string(generator_());
        job            = std::make_shared<JobCoordinator>(id, std::move(request), services_);
        if (on_page)
            job->on_page(std::move(on_page));
        jobs_[id] = job;
    }
    job->start();
    return job->id();
}

std::shared_ptr<JobCoordinator> JobRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(id);
    return it != jobs_.end() ? it->second : nullptr;
}

std::optional<JobResult> JobRegistry::status(const std::string& id) const {
    if (auto job = find(id))
        return job->status();
    if (services_.store)
        return services_.store->load(id);
    return std::nullopt;
}

bool JobRegistry::cancel(const std::string& id) {
    auto job = find(id);
    if (!job)
        return false;
    job->cancel();
    return true;
}

PurgeResult JobRegistry::purge(const std::string& id) {
    bool in_memory = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = jobs_.find(id);
        if (it != jobs_.end()) {
            if (!is_terminal(it->second->state()))
                return PurgeResult::Running;
            jobs_.erase(it);
            in_memory = true;
        }
    }

    bool on_disk = false;
    if (services_.store) {
        try {
            on_disk = services_.store->remove(id);
        } catch (const std::exception& e) {
            Logger::error("Purge of " + id + " failed in store: " + e.what());
        }
    }
    return (in_memory || on_disk) ? PurgeResult::Purged : PurgeResult::NotFound;
}

std::vector<JobResult> JobRegistry::list() const {
    std::vector<std::shared_ptr<JobCoordinator>> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, job] : jobs_)
            jobs.push_back(job);
    }

    std::vector<JobResult> results;
    for (const auto& job : jobs)
        results.push_back(job->status());

    if (services_.store) {
        for (const auto& id : services_.store->list()) {
            bool known = std::any_of(results.begin(), results.end(), [&](const JobResult& r) {
                return r.id == id;
            });
            if (known)
                continue;
            if (auto stored = services_.store->load(id))
                results.push_back(std::move(*stored));
        }
    }

    std::sort(results.begin(), results.end(), [](const JobResult& a, const JobResult& b) {
        return a.created_at > b.created_at;
    });
    return results;
}

void JobRegistry::shutdown(std::chrono::milliseconds timeout) {
    std::vector<std::shared_ptr<JobCoordinator>> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_)
            return;
        shutting_down_ = true;
        for (const auto& [id, job] : jobs_)
            jobs.push_back(job);
    }

    for (const auto& job : jobs)
        job->cancel();
    for (const auto& job : jobs) {
        if (!job->await_completion(timeout))
            Logger::warn("Job " + job->id() + " did not stop within the shutdown timeout");
    }
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

}  // namespace Engine
}  // namespace Trawl

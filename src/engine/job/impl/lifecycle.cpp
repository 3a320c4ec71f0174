#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../job_coordinator.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

JobDefaults JobDefaults::from_config(const Config& config) {
    JobDefaults d;
    d.respect_robots      = config.respect_robots;
    d.politeness_delay_ms = config.politeness_delay_ms;
    d.fetch_timeout_ms    = config.fetch_timeout_ms;
    d.max_attempts        = config.max_attempts;
    d.backoff_ms          = config.backoff_ms;
    d.max_pool_size       = config.max_pool_size;
    d.user_agent          = config.user_agent;
    d.llm_model           = config.llm_model;
    return d;
}

namespace {

FrontierPolicy make_policy(const JobPlan& plan) {
    FrontierPolicy policy;
    policy.max_depth   = plan.max_depth;
    policy.same_domain = plan.same_domain;
    policy.scope       = plan.scope;
    return policy;
}

FetchConfig make_fetch_config(const JobPlan& plan, const JobDefaults& defaults) {
    FetchConfig config;
    config.render.timeout    = std::chrono::milliseconds(defaults.fetch_timeout_ms);
    config.render.user_agent =
        plan.options.user_agent.empty() ? defaults.user_agent : plan.options.user_agent;
    config.use_browser       = plan.options.use_browser;
    config.respect_robots    = plan.options.respect_robots.value_or(defaults.respect_robots);
    config.politeness_delay =
        std::chrono::milliseconds(std::max(defaults.politeness_delay_ms, plan.options.delay_ms));
    config.max_attempts    = defaults.max_attempts;
    config.backoff_base_ms = defaults.backoff_ms;
    config.expand_links    = plan.expand_links;
    config.max_depth       = plan.max_depth;
    return config;
}

}  // namespace

JobCoordinator::JobCoordinator(std::string id, JobRequest request, JobServices services)
    : id_(std::move(id)),
      request_(std::move(request)),
      plan_(make_plan(request_, services.defaults.llm_model)),
      services_(std::move(services)),
      fetch_config_(make_fetch_config(plan_, services_.defaults)),
      pool_size_(std::clamp(plan_.pool_size, 1, std::max(1, services_.defaults.max_pool_size))),
      frontier_(make_policy(plan_)),
      created_at_(Clock::now()) {
    if (!services_.runtime || !services_.fetcher || !services_.extractor)
        throw JobInternalError("job " + id_ + " is missing a collaborator");
}

void JobCoordinator::on_page(PageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    page_callback_ = std::move(callback);
}

void JobCoordinator::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != JobStatus::Pending)
            return;
        status_ = JobStatus::Running;

        for (const auto& url : plan_.seeds) {
            if (!frontier_.seed(url))
                Logger::info("Job " + id_ + ": duplicate seed " + url);
        }
        if (plan_.max_duration.count() > 0)
            deadline_ = std::chrono::steady_clock::now() + plan_.max_duration;
        live_workers_ = pool_size_;
    }

    Logger::info("Job " + id_ + " (" + to_string(plan_.mode) + "): " +
                 std::to_string(plan_.seeds.size()) + " seed(s), " + std::to_string(pool_size_) +
                 " worker(s)");
    spawn_workers();
}

void JobCoordinator::spawn_workers() {
    auto self = shared_from_this();
    for (int i = 0; i < pool_size_; ++i) {
        boost::asio::co_spawn(
            services_.runtime->executor(),
            [self]() { return self->worker_loop(); },
            boost::asio::detached);
    }
}

void JobCoordinator::cancel() {
    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(status_) || cancel_requested_)
            return;
        cancel_requested_ = true;
        Logger::warn("Job " + id_ + ": cancellation requested");
        if (status_ == JobStatus::Pending) {
            status_       = JobStatus::Cancelled;
            completed_at_ = Clock::now();
            notify        = true;
        }
    }
    if (notify)
        done_cv_.notify_all();
}

void JobCoordinator::fail(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_)
        return;
    failed_ = true;
    error_  = error;
    Logger::error("Job " + id_ + " failed: " + error);
}

void JobCoordinator::finalize() {
    JobResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failed_)
            result.status = JobStatus::Failed;
        else if (cancel_requested_)
            result.status = JobStatus::Cancelled;
        else
            result.status = JobStatus::Completed;
        completed_at_ = Clock::now();

        auto final_status = result.status;
        result            = snapshot_locked();
        result.status     = final_status;
    }

    if (services_.store) {
        try {
            services_.store->save(result);
        } catch (const std::exception& e) {
            result.status = JobStatus::Failed;
            result.error  = std::string("store failure: ") + e.what();
            Logger::error("Job " + id_ + ": " + result.error);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = result.status;
        if (!result.error.empty())
            error_ = result.error;
    }
    done_cv_.notify_all();

    const auto& c = result.counts;
    std::string summary = "Job " + id_ + " " + to_string(result.status) + ": " +
                          std::to_string(c.succeeded) + " ok, " + std::to_string(c.failed) +
                          " failed, " + std::to_string(c.skipped_by_robots) + " blocked";
    if (result.status == JobStatus::Completed)
        Logger::success(summary);
    else
        Logger::warn(summary);
}

JobResult JobCoordinator::snapshot_locked() const {
    JobResult result;
    result.id           = id_;
    result.request      = request_;
    result.status       = status_;
    result.counts       = counts_;
    result.error        = error_;
    result.created_at   = created_at_;
    result.completed_at = completed_at_;

    result.pages.reserve(results_.size());
    for (const auto& [url, page] : results_) {
        result.pages.push_back(page);
    }
    std::sort(result.pages.begin(), result.pages.end(), [](const PageResult& a, const PageResult& b) {
        if (a.depth != b.depth)
            return a.depth < b.depth;
        return a.sequence < b.sequence;
    });
    return result;
}

JobResult JobCoordinator::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

JobStatus JobCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<JobResult> JobCoordinator::await_completion(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!done_cv_.wait_for(lock, timeout, [this] { return is_terminal(status_); }))
        return std::nullopt;
    return snapshot_locked();
}

JobResult JobCoordinator::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return is_terminal(status_); });
    return snapshot_locked();
}

}  // namespace Engine
}  // namespace Trawl

#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../../core/config/config.hpp"
#include "../../core/runtime/runtime.hpp"
#include "../../extract/extractor.hpp"
#include "../../storage/store.hpp"
#include "../fetcher/fetcher.hpp"
#include "../frontier/frontier.hpp"
#include "../types.hpp"

#ifndef CPPCHECK
class JobCoordinatorTest_PoolSizeClampedToCeiling_Test;
#endif

namespace Trawl {
namespace Engine {

// Service-wide settings a job falls back to when its request does not override them.
struct JobDefaults {
    bool        respect_robots      = true;
    int         politeness_delay_ms = Core::Constants::DEFAULT_POLITENESS_MS;
    int         fetch_timeout_ms    = Core::Constants::REQUEST_TIMEOUT_SECONDS * 1000;
    int         max_attempts        = Core::Constants::MAX_ATTEMPTS;
    int         backoff_ms          = Core::Constants::BACKOFF_BASE_MS;
    int         max_pool_size       = Core::Constants::MAX_POOL_SIZE;
    std::string user_agent          = Core::Constants::USER_AGENT;
    std::string llm_model           = Core::Constants::LLM_MODEL;

    static JobDefaults from_config(const Core::Config& config);
};

struct JobServices {
    Core::Runtime*                      runtime = nullptr;
    std::shared_ptr<Fetcher>            fetcher;
    std::shared_ptr<Extract::Extractor> extractor;
    std::shared_ptr<Storage::Store>     store;  // optional
    JobDefaults                         defaults;
};

// Runs one job: owns its Frontier, a pool of worker coroutines and the
// accumulated page results. pending -> running -> completed | failed | cancelled.
class JobCoordinator : public std::enable_shared_from_this<JobCoordinator> {
#ifndef CPPCHECK
    friend class ::JobCoordinatorTest_PoolSizeClampedToCeiling_Test;
#endif

public:
    using PageCallback = std::function<void(const PageResult&)>;

    JobCoordinator(std::string id, JobRequest request, JobServices services);

    void start();
    void cancel();

    // Consistent point-in-time copy, pages ordered by (depth, sequence).
    JobResult status() const;
    JobStatus state() const;

    // Empty if the job is still running after `timeout`.
    std::optional<JobResult> await_completion(std::chrono::milliseconds timeout) const;
    JobResult                wait() const;

    // Called from worker threads for each recorded page. Set before start().
    void on_page(PageCallback callback);

    const std::string& id() const {
        return id_;
    }
    const JobPlan& plan() const {
        return plan_;
    }

private:
    std::string id_;
    JobRequest  request_;
    JobPlan     plan_;
    JobServices services_;
    FetchConfig fetch_config_;
    int         pool_size_;
    Frontier    frontier_;
    Timestamp   created_at_;

    mutable std::mutex                     mutex_;
    mutable std::condition_variable        done_cv_;
    JobStatus                              status_ = JobStatus::Pending;
    std::string                            error_;
    std::optional<Timestamp>               completed_at_;
    std::map<std::string, PageResult>      results_;
    PageCounts                             counts_;
    std::size_t                            dispatched_       = 0;
    int                                    active_           = 0;
    int                                    live_workers_     = 0;
    bool                                   cancel_requested_ = false;
    bool                                   failed_           = false;
    std::multiset<int>                     in_flight_depths_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    PageCallback                           page_callback_;

    // lifecycle
    void      spawn_workers();
    void      finalize();
    void      fail(const std::string& error);
    JobResult snapshot_locked() const;

    // worker
    boost::asio::awaitable<void> worker_loop();
    std::optional<FrontierEntry> fetch_next_task();
    bool                         should_stop_worker();
    void                         release_task(int depth);
    boost::asio::awaitable<void> process_entry(const FrontierEntry& entry);

    // results
    PageResult build_page(const FrontierEntry& entry, const FetchOutcome& outcome) const;
    boost::asio::awaitable<void> run_instruction(PageResult& page, const std::string& markdown);
    void record_page(PageResult page, const std::vector<std::string>& links, int depth);
};

}  // namespace Engine
}  // namespace Trawl

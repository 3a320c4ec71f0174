#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../core/types/constants.hpp"
#include "../job_coordinator.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

std::optional<FrontierEntry> JobCoordinator::fetch_next_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_ || failed_)
        return std::nullopt;

    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
        Logger::warn("Job " + id_ + ": max duration reached, cancelling");
        cancel_requested_ = true;
        frontier_.clear();
        return std::nullopt;
    }

    if (plan_.max_pages > 0 && dispatched_ >= static_cast<std::size_t>(plan_.max_pages)) {
        if (!frontier_.empty()) {
            Logger::info("Job " + id_ + ": page limit " + std::to_string(plan_.max_pages) +
                         " reached, dropping " + std::to_string(frontier_.size()) + " queued");
            frontier_.clear();
        }
        return std::nullopt;
    }

    auto depth = frontier_.peek_depth();
    if (!depth)
        return std::nullopt;

    // A fetch two levels up may still add entries that belong before this one.
    if (!in_flight_depths_.empty() && *in_flight_depths_.begin() < *depth - 1)
        return std::nullopt;

    auto entry = frontier_.pop();
    if (!entry)
        return std::nullopt;
    ++dispatched_;
    ++active_;
    in_flight_depths_.insert(entry->depth);
    return entry;
}

bool JobCoordinator::should_stop_worker() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_requested_ || failed_ || (active_ == 0 && frontier_.empty());
}

void JobCoordinator::release_task(int depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    --active_;
    auto it = in_flight_depths_.find(depth);
    if (it != in_flight_depths_.end())
        in_flight_depths_.erase(it);
}

boost::asio::awaitable<void> JobCoordinator::worker_loop() {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    for (;;) {
        auto task = fetch_next_task();
        if (!task) {
            if (should_stop_worker())
                break;
            timer.expires_after(std::chrono::milliseconds(Constants::WORKER_POLL_INTERVAL_MS));
            boost::system::error_code ec;
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            continue;
        }

        try {
            co_await process_entry(*task);
        } catch (const JobInternalError& e) {
            fail(e.what());
        } catch (const std::exception& e) {
            fail("worker error on " + task->url + ": " + e.what());
        }
        release_task(task->depth);
    }

    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last = --live_workers_ == 0;
    }
    if (last)
        finalize();
}

boost::asio::awaitable<void> JobCoordinator::process_entry(const FrontierEntry& entry) {
    Logger::info("Fetching: " + entry.url + " (Depth " + std::to_string(entry.depth) + ")");
    FetchOutcome outcome = co_await services_.fetcher->fetch(entry, fetch_config_);

    auto self = shared_from_this();
    PageResult page = co_await services_.runtime->offload(
        [self, &entry, &outcome]() { return self->build_page(entry, outcome); });

    if (plan_.mode == Mode::Agent && page.succeeded() && page.content) {
        std::string markdown = std::move(*page.content);
        page.content.reset();
        co_await run_instruction(page, markdown);
    }

    record_page(std::move(page), outcome.links, entry.depth);
}

}  // namespace Engine
}  // namespace Trawl

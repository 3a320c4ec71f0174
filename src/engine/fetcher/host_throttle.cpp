#include "host_throttle.hpp"
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

boost::asio::awaitable<std::chrono::milliseconds>
HostThrottle::wait_turn(const std::string& origin, std::chrono::milliseconds delay) {
    std::chrono::milliseconds wait_time(0);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        now  = std::chrono::steady_clock::now();
        auto                        slot = now;

        auto it = next_slot_.find(origin);
        if (it != next_slot_.end() && it->second > now)
            slot = it->second;

        // Origins whose last slot has passed carry no spacing constraint.
        for (auto stale = next_slot_.begin(); stale != next_slot_.end();) {
            if (stale->second <= now)
                stale = next_slot_.erase(stale);
            else
                ++stale;
        }

        wait_time = std::chrono::duration_cast<std::chrono::milliseconds>(slot - now);
        next_slot_[origin] = slot + delay;
    }

    if (wait_time.count() > 0) {
        Logger::info("Politeness: Waiting " + std::to_string(wait_time.count()) + "ms for " +
                     origin);
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        timer.expires_after(wait_time);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
    co_return wait_time;
}

std::size_t HostThrottle::tracked_origins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_slot_.size();
}

}  // namespace Engine
}  // namespace Trawl

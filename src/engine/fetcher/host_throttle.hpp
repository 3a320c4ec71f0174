#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace Trawl {
namespace Engine {

// Per-origin politeness shared by every job in the process.
class HostThrottle {
public:
    // Reserves the next slot for `origin`, at least `delay` after the previous
    // reservation, and suspends until it. Returns the time waited.
    boost::asio::awaitable<std::chrono::milliseconds> wait_turn(const std::string&        origin,
                                                                std::chrono::milliseconds delay);

    // Origins with a reservation still in the future, as of the last wait_turn.
    std::size_t tracked_origins() const;

private:
    mutable std::mutex                                           mutex_;
    std::map<std::string, std::chrono::steady_clock::time_point> next_slot_;
};

}  // namespace Engine
}  // namespace Trawl

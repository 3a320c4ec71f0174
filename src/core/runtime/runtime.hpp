#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

namespace Trawl {
namespace Core {

// Owns the io_context shared by every job, the threads running it, and the
// CPU pool content extraction is offloaded to.
class Runtime {
public:
    Runtime(int io_threads, int worker_threads);
    ~Runtime();

    Runtime(const Runtime&)            = delete;
    Runtime& operator=(const Runtime&) = delete;

    void start();
    void shutdown();
    void on_signal(std::function<void(int)> handler);

    boost::asio::io_context& io_context() {
        return ioc_;
    }
    boost::asio::any_io_executor executor() {
        return ioc_.get_executor();
    }
    boost::asio::thread_pool& worker_pool() {
        return worker_pool_;
    }

    // Runs fn on the worker pool and resumes the caller on its own executor.
    template <typename F>
    boost::asio::awaitable<std::invoke_result_t<F>> offload(F fn) {
        using Result = std::invoke_result_t<F>;
        co_return co_await boost::asio::co_spawn(
            worker_pool_.get_executor(),
            [fn = std::move(fn)]() -> boost::asio::awaitable<Result> { co_return fn(); },
            boost::asio::use_awaitable);
    }

private:
    int num_threads_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::thread_pool worker_pool_;
    boost::asio::signal_set  signals_{ioc_};
    std::atomic<bool>        is_started_{false};
    std::atomic<bool>        is_shutdown_{false};
};

}  // namespace Core
}  // namespace Trawl

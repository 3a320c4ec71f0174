#include "runtime.hpp"
#include <csignal>
#include "../logger/logger.hpp"

namespace Trawl {
namespace Core {

Runtime::Runtime(int io_threads, int worker_threads)
    : num_threads_(io_threads < 1 ? 1 : io_threads),
      worker_pool_(static_cast<std::size_t>(worker_threads < 1 ? 1 : worker_threads)) {
}

Runtime::~Runtime() {
    shutdown();
}

void Runtime::start() {
    if (is_started_.exchange(true))
        return;

    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < num_threads_; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::info("Started " + std::to_string(num_threads_) + " IO threads.");
}

void Runtime::on_signal(std::function<void(int)> handler) {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait(
        [handler = std::move(handler)](const boost::system::error_code& error, int signal_number) {
            if (!error) {
                Logger::info("Signal " + std::to_string(signal_number) + " received. Stopping...");
                handler(signal_number);
            }
        });
}

void Runtime::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    boost::system::error_code ec;
    signals_.cancel(ec);

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            t.detach();
        else if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    worker_pool_.stop();
    worker_pool_.join();
    Logger::info("Runtime stopped.");
}

}  // namespace Core
}  // namespace Trawl

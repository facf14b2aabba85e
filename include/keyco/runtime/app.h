#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/signal_set.hpp>

#include <keyco/runtime/delivery_context.h>
#include <keyco/runtime/io_context_pool.h>

namespace keyco {

struct AppOptions {
    // 0 picks IoContextPool::DefaultThreads().
    std::size_t io_threads = 0;
    std::string log_level = "info";
};

// Process runtime: logging, the network I/O pool and the delivery context.
class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    IoContextPool& Io() { return io_; }
    DeliveryContext& Delivery() { return delivery_; }

    // Called once, on an I/O thread, when SIGINT or SIGTERM arrives.
    // Must be set before Start().
    void OnInterrupt(std::function<void()> fn);

    void Start();
    // Idempotent
    void Stop();

private:
    AppOptions options_;
    IoContextPool io_;
    DeliveryContext delivery_;

    std::function<void()> on_interrupt_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    std::mutex mu_;
    std::atomic<bool> started_{false};
};

} // namespace keyco

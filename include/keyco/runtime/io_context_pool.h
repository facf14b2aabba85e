#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace keyco {

// N single-threaded io_contexts handed out round-robin. Handlers bound to one
// context never run concurrently with each other.
class IoContextPool {
public:
    // The client only waits on sockets, and a keyboard host cannot afford a
    // thread per core.
    static constexpr std::size_t kMaxDefaultThreads = 2;

    // min(hardware_concurrency, kMaxDefaultThreads), at least 1.
    static std::size_t DefaultThreads();

    // 0 picks DefaultThreads().
    explicit IoContextPool(std::size_t threads = 0);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Thread-safe
    boost::asio::io_context& Next();

    std::size_t size() const { return contexts_.size(); }
    bool running() const { return started_.load(std::memory_order_acquire); }

    void Start();
    // Idempotent. Pending handlers are dropped.
    void Stop();

private:
    std::vector<std::unique_ptr<boost::asio::io_context>> contexts_;
    std::vector<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guards_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> rr_{0};
    std::atomic<bool> started_{false};
};

} // namespace keyco

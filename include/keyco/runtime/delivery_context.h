#pragma once

#include <atomic>
#include <functional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace keyco {

// The single thread on which every user-visible callback runs. Client timers
// (retry backoff, fail-safe) are scheduled on the same context so they are
// serialized with deliveries.
class DeliveryContext {
public:
    DeliveryContext();
    ~DeliveryContext();

    DeliveryContext(const DeliveryContext&) = delete;
    DeliveryContext& operator=(const DeliveryContext&) = delete;

    // Thread-safe
    void Post(std::function<void()> fn);

    boost::asio::io_context& io() { return ioc_; }

    // True when called from the delivery thread.
    bool InDeliveryThread() const;

    void Start();
    // Idempotent. Joins the delivery thread; must not be called from it.
    void Stop();

private:
    boost::asio::io_context ioc_{1};
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{};
    std::atomic<bool> started_{false};
};

} // namespace keyco

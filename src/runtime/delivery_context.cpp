#include <keyco/runtime/delivery_context.h>

#include <keyco/core/log.h>

#include <exception>

#include <boost/asio/post.hpp>

namespace keyco {

DeliveryContext::DeliveryContext() : guard_(boost::asio::make_work_guard(ioc_)) {}

DeliveryContext::~DeliveryContext() {
    Stop();
}

void DeliveryContext::Post(std::function<void()> fn) {
    boost::asio::post(ioc_, [fn = std::move(fn)] {
        // A throwing user callback must not take the delivery thread down.
        try {
            fn();
        } catch (const std::exception& e) {
            keyco::log::error("delivery callback threw: {}", e.what());
        }
    });
}

bool DeliveryContext::InDeliveryThread() const {
    return worker_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

void DeliveryContext::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }
    worker_ = std::thread([this] {
        worker_id_.store(std::this_thread::get_id(), std::memory_order_release);
        ioc_.run();
    });
}

void DeliveryContext::Stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }
    guard_.reset();
    ioc_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_id_.store(std::thread::id{}, std::memory_order_release);
}

} // namespace keyco

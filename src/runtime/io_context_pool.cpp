#include <keyco/runtime/io_context_pool.h>

#include <keyco/core/log.h>

#include <algorithm>

namespace keyco {

std::size_t IoContextPool::DefaultThreads() {
    auto hc = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return std::clamp<std::size_t>(hc, 1, kMaxDefaultThreads);
}

IoContextPool::IoContextPool(std::size_t threads) {
    if (threads == 0) {
        threads = DefaultThreads();
    }

    contexts_.reserve(threads);
    guards_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        // concurrency hint 1: each context is driven by exactly one worker
        auto ctx = std::make_unique<boost::asio::io_context>(1);
        guards_.push_back(boost::asio::make_work_guard(*ctx));
        contexts_.push_back(std::move(ctx));
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

boost::asio::io_context& IoContextPool::Next() {
    auto idx = rr_.fetch_add(1, std::memory_order_relaxed) % contexts_.size();
    return *contexts_[idx];
}

void IoContextPool::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }

    workers_.reserve(contexts_.size());
    for (auto& ctx : contexts_) {
        workers_.emplace_back([c = ctx.get()] { c->run(); });
    }
    keyco::log::debug("io pool started: {} thread(s)", workers_.size());
}

void IoContextPool::Stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }

    for (auto& g : guards_) {
        g.reset();
    }
    for (auto& ctx : contexts_) {
        ctx->stop();
    }
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

} // namespace keyco

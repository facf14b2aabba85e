#include <keyco/runtime/app.h>

#include <keyco/core/log.h>

#include <csignal>

namespace keyco {

App::App(AppOptions options)
    : options_(std::move(options)),
      io_(options_.io_threads) {
    keyco::log::Init(options_.log_level);
}

App::~App() {
    Stop();
}

void App::OnInterrupt(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    on_interrupt_ = std::move(fn);
}

void App::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        signals_ = std::make_unique<boost::asio::signal_set>(io_.Next(), SIGINT, SIGTERM);
        signals_->async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            keyco::log::info("received signal {}, interrupting", signo);
            std::function<void()> fn;
            {
                std::lock_guard<std::mutex> lk(mu_);
                fn = on_interrupt_;
            }
            if (fn) {
                fn();
            }
        });
    }

    delivery_.Start();
    io_.Start();
    keyco::log::debug("runtime started: io_threads={}", io_.size());
}

void App::Stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }

    // The signal_set is only touched again once no I/O thread is running.
    io_.Stop();
    delivery_.Stop();
    {
        std::lock_guard<std::mutex> lk(mu_);
        signals_.reset();
    }
    keyco::log::debug("runtime stopped");
}

} // namespace keyco

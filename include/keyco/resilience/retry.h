#pragma once

#include <chrono>

namespace keyco::resilience {

struct RetryOptions {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds min_delay{100};
    double jitter_ratio = 0.3; // [0,1]
};

// Exponential backoff with symmetric jitter:
//   Delay(n) = max(min_delay, base_delay * 2^n * (1 + U(-jitter, +jitter)))
class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions opts);

    int max_retries() const { return opts_.max_retries; }
    const RetryOptions& options() const { return opts_; }

    // attempt is 0-based: the attempt that just failed.
    bool ShouldRetry(bool retryable, int attempt) const;

    template <class Error>
    bool ShouldRetry(const Error& error, int attempt) const {
        return ShouldRetry(error.ShouldRetry(), attempt);
    }

    // Thread-safe. The jitter is drawn independently on every call.
    std::chrono::milliseconds Delay(int attempt) const;

private:
    RetryOptions opts_;
};

} // namespace keyco::resilience

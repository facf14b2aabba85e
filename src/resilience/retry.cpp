#include <keyco/resilience/retry.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace keyco::resilience {
namespace {

std::mt19937_64& Rng() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

} // namespace

RetryPolicy::RetryPolicy(RetryOptions opts) : opts_(opts) {
    opts_.max_retries = std::max(opts_.max_retries, 0);
    opts_.jitter_ratio = std::clamp(opts_.jitter_ratio, 0.0, 1.0);
    if (opts_.min_delay.count() < 0) {
        opts_.min_delay = std::chrono::milliseconds(0);
    }
    if (opts_.base_delay.count() < 0) {
        opts_.base_delay = std::chrono::milliseconds(0);
    }
}

bool RetryPolicy::ShouldRetry(bool retryable, int attempt) const {
    return retryable && attempt < opts_.max_retries;
}

std::chrono::milliseconds RetryPolicy::Delay(int attempt) const {
    // 2^30 * base already exceeds any sensible backoff; keep the double finite.
    auto exp = std::clamp(attempt, 0, 30);
    double raw = static_cast<double>(opts_.base_delay.count()) * std::ldexp(1.0, exp);

    std::uniform_real_distribution<double> dist(-opts_.jitter_ratio, opts_.jitter_ratio);
    double jittered = raw * (1.0 + dist(Rng()));

    auto floor = static_cast<double>(opts_.min_delay.count());
    return std::chrono::milliseconds(static_cast<long long>(std::llround(std::max(floor, jittered))));
}

} // namespace keyco::resilience

#include <keyco/resilience/deduplicator.h>

namespace keyco::resilience {

RequestDeduplicator::RequestDeduplicator(DeduplicatorOptions opts, Clock clock)
    : opts_(opts), clock_(std::move(clock)) {}

bool RequestDeduplicator::IsDuplicate(const std::string& key) {
    auto now = Now(clock_);
    std::lock_guard<std::mutex> lk(mu_);

    for (auto it = first_seen_.begin(); it != first_seen_.end();) {
        if (now - it->second >= opts_.retention) {
            it = first_seen_.erase(it);
        } else {
            ++it;
        }
    }

    auto it = first_seen_.find(key);
    if (it != first_seen_.end() && now - it->second < opts_.window) {
        return true;
    }
    first_seen_[key] = now;
    return false;
}

void RequestDeduplicator::Forget(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    first_seen_.erase(key);
}

std::size_t RequestDeduplicator::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return first_seen_.size();
}

} // namespace keyco::resilience

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

#include <keyco/core/clock.h>

namespace keyco::resilience {

struct DeduplicatorOptions {
    // A key seen again within this window is a duplicate.
    std::chrono::milliseconds window{5000};
    // Records older than this are purged before every lookup.
    std::chrono::milliseconds retention{300000};
};

class RequestDeduplicator {
public:
    explicit RequestDeduplicator(DeduplicatorOptions opts, Clock clock = {});

    // Thread-safe. Returns true if `key` was recorded less than `window` ago.
    // Otherwise records `key` as seen now and returns false.
    bool IsDuplicate(const std::string& key);

    // Thread-safe. Drops the record so an identical request can start at once.
    void Forget(const std::string& key);

    std::size_t size() const;

private:
    DeduplicatorOptions opts_;
    Clock clock_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, TimePoint> first_seen_;
};

} // namespace keyco::resilience

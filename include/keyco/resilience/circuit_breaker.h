#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include <keyco/core/clock.h>

namespace keyco::resilience {

enum class CircuitPhase {
    closed = 0,
    open,
    half_open,
};

const char* ToString(CircuitPhase phase);

// Closed | Open(until) | HalfOpen(until). `until` is meaningless when closed.
struct CircuitState {
    CircuitPhase phase = CircuitPhase::closed;
    TimePoint until{};

    bool closed() const { return phase == CircuitPhase::closed; }
    bool open() const { return phase == CircuitPhase::open; }
    bool half_open() const { return phase == CircuitPhase::half_open; }
};

struct CircuitBreakerOptions {
    std::uint32_t failure_threshold = 3;
    std::chrono::milliseconds cooldown{8000};
    std::chrono::milliseconds half_open_timeout{5000};
};

// Every method takes the same lock, so each transition is a single
// read-modify-write against the clock.
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerOptions opts, Clock clock = {});

    // Thread-safe. Applies time-driven transitions before answering:
    // Open past `until` -> HalfOpen, HalfOpen past `until` -> Open.
    CircuitState CurrentState();

    // Thread-safe. In HalfOpen, claims the single trial slot. Returns true in
    // Closed; false in Open or when the slot is taken.
    bool TryAcquireProbe();

    // Thread-safe. Gives back a trial slot without recording an outcome
    // (the trial was cancelled).
    void ReleaseProbe();

    // Thread-safe
    void RecordSuccess();

    // Thread-safe
    void RecordFailure();

    // Thread-safe. Forces Closed with a zero failure count.
    void Reset();

    std::uint32_t consecutive_failures() const;
    const CircuitBreakerOptions& options() const { return opts_; }

private:
    void AdvanceLocked(TimePoint now);
    void OpenLocked(TimePoint now);

    CircuitBreakerOptions opts_;
    Clock clock_;

    mutable std::mutex mu_;
    CircuitState state_;
    std::uint32_t consecutive_failures_ = 0;
    bool probe_in_flight_ = false;
};

} // namespace keyco::resilience

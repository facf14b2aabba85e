#include <keyco/resilience/circuit_breaker.h>

#include <keyco/core/log.h>

namespace keyco::resilience {

const char* ToString(CircuitPhase phase) {
    switch (phase) {
        case CircuitPhase::closed: return "closed";
        case CircuitPhase::open: return "open";
        case CircuitPhase::half_open: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions opts, Clock clock)
    : opts_(opts), clock_(std::move(clock)) {
    if (opts_.failure_threshold == 0) {
        // a zero threshold would open on construction
        opts_.failure_threshold = 1;
    }
}

void CircuitBreaker::OpenLocked(TimePoint now) {
    state_.phase = CircuitPhase::open;
    state_.until = now + opts_.cooldown;
    probe_in_flight_ = false;
}

void CircuitBreaker::AdvanceLocked(TimePoint now) {
    if (state_.phase == CircuitPhase::open && now >= state_.until) {
        state_.phase = CircuitPhase::half_open;
        state_.until = now + opts_.half_open_timeout;
        probe_in_flight_ = false;
        keyco::log::info("circuit breaker half-open");
        return;
    }
    if (state_.phase == CircuitPhase::half_open && now >= state_.until) {
        OpenLocked(now);
        keyco::log::warn("circuit breaker re-opened: half-open window elapsed without a success");
    }
}

CircuitState CircuitBreaker::CurrentState() {
    auto now = Now(clock_);
    std::lock_guard<std::mutex> lk(mu_);
    AdvanceLocked(now);
    return state_;
}

bool CircuitBreaker::TryAcquireProbe() {
    auto now = Now(clock_);
    std::lock_guard<std::mutex> lk(mu_);
    AdvanceLocked(now);
    switch (state_.phase) {
        case CircuitPhase::closed:
            return true;
        case CircuitPhase::open:
            return false;
        case CircuitPhase::half_open:
            if (probe_in_flight_) {
                return false;
            }
            probe_in_flight_ = true;
            return true;
    }
    return false;
}

void CircuitBreaker::ReleaseProbe() {
    std::lock_guard<std::mutex> lk(mu_);
    probe_in_flight_ = false;
}

void CircuitBreaker::RecordSuccess() {
    std::lock_guard<std::mutex> lk(mu_);
    consecutive_failures_ = 0;
    probe_in_flight_ = false;
    if (state_.phase != CircuitPhase::closed) {
        keyco::log::info("circuit breaker closed after success in {}", ToString(state_.phase));
        state_.phase = CircuitPhase::closed;
        state_.until = TimePoint{};
    }
}

void CircuitBreaker::RecordFailure() {
    auto now = Now(clock_);
    std::lock_guard<std::mutex> lk(mu_);
    AdvanceLocked(now);

    switch (state_.phase) {
        case CircuitPhase::closed:
            ++consecutive_failures_;
            if (consecutive_failures_ >= opts_.failure_threshold) {
                OpenLocked(now);
                keyco::log::warn("circuit breaker opened after {} consecutive failures, cooldown {}ms",
                    consecutive_failures_, opts_.cooldown.count());
            }
            return;
        case CircuitPhase::half_open:
            ++consecutive_failures_;
            OpenLocked(now);
            keyco::log::warn("circuit breaker re-opened: half-open trial failed");
            return;
        case CircuitPhase::open:
            // already tripped; the cooldown is not extended
            ++consecutive_failures_;
            return;
    }
}

void CircuitBreaker::Reset() {
    std::lock_guard<std::mutex> lk(mu_);
    consecutive_failures_ = 0;
    probe_in_flight_ = false;
    state_ = CircuitState{};
    keyco::log::info("circuit breaker reset");
}

std::uint32_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lk(mu_);
    return consecutive_failures_;
}

} // namespace keyco::resilience

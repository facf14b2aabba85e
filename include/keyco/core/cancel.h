#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace keyco {

namespace detail {
struct CancelState;
} // namespace detail

class CancelToken;

// Removes its callback from the token when destroyed. Move-only.
class CancelRegistration {
public:
    CancelRegistration() = default;
    ~CancelRegistration();

    CancelRegistration(CancelRegistration&& other) noexcept;
    CancelRegistration& operator=(CancelRegistration&& other) noexcept;

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

    void Reset();

private:
    friend class CancelToken;
    CancelRegistration(std::weak_ptr<detail::CancelState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::CancelState> state_;
    std::uint64_t id_ = 0;
};

// Observer side of a cancellation signal. Cheap to copy; a default constructed
// token can never be cancelled.
class CancelToken {
public:
    CancelToken() = default;

    // Thread-safe
    bool cancelled() const;

    // Thread-safe. Runs fn on the cancelling thread, or immediately on the
    // calling thread when the token is already cancelled.
    [[nodiscard]] CancelRegistration OnCancel(std::function<void()> fn) const;

private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<detail::CancelState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

class CancelSource {
public:
    CancelSource();

    CancelToken token() const { return CancelToken(state_); }

    // Thread-safe, idempotent. Returns false if already cancelled.
    bool Cancel();

    bool cancelled() const;

private:
    std::shared_ptr<detail::CancelState> state_;
};

namespace detail {

struct CancelState {
    std::mutex mu;
    bool cancelled = false;
    std::uint64_t next_id = 1;
    std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;
};

} // namespace detail

} // namespace keyco

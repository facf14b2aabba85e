#include <keyco/core/cancel.h>

#include <algorithm>

namespace keyco {

CancelRegistration::~CancelRegistration() {
    Reset();
}

CancelRegistration::CancelRegistration(CancelRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancelRegistration& CancelRegistration::operator=(CancelRegistration&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancelRegistration::Reset() {
    if (id_ == 0) {
        return;
    }
    if (auto st = state_.lock()) {
        std::lock_guard<std::mutex> lk(st->mu);
        auto& cbs = st->callbacks;
        cbs.erase(std::remove_if(cbs.begin(), cbs.end(), [this](const auto& e) { return e.first == id_; }), cbs.end());
    }
    state_.reset();
    id_ = 0;
}

bool CancelToken::cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->cancelled;
}

CancelRegistration CancelToken::OnCancel(std::function<void()> fn) const {
    if (!state_) {
        return {};
    }
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace_back(id, std::move(fn));
            return CancelRegistration(state_, id);
        }
    }
    fn();
    return {};
}

CancelSource::CancelSource() : state_(std::make_shared<detail::CancelState>()) {}

bool CancelSource::Cancel() {
    std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        if (state_->cancelled) {
            return false;
        }
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    // Outside the lock: callbacks may register or reset other registrations.
    for (auto& cb : callbacks) {
        cb.second();
    }
    return true;
}

bool CancelSource::cancelled() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->cancelled;
}

} // namespace keyco

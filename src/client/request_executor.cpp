#include <keyco/client/request_executor.h>

#include <keyco/client/request_key.h>
#include <keyco/client/wire.h>
#include <keyco/core/log.h>

#include <cmath>
#include <vector>

#include <boost/asio/steady_timer.hpp>

namespace keyco::client {
namespace {

constexpr const char* kDuplicateProgress = "Request already in progress...";

const std::vector<double>& LatencyBuckets() {
    static const std::vector<double> kBuckets{50, 100, 250, 500, 1000, 2500, 5000, 10000, 15000, 30000, 60000};
    return kBuckets;
}

bool InUnitRange(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

} // namespace

struct RequestExecutor::Call {
    explicit Call(boost::asio::io_context& delivery_io) : retry_timer(delivery_io), failsafe_timer(delivery_io) {}

    std::uint64_t id = 0;
    Operation op = Operation::rewrite;
    std::string path;
    std::string body;
    std::string dedup_key;
    ProgressCallback on_progress;
    CompletionCallback on_complete;
    TimePoint started{};

    // Fired by user cancellation, the fail-safe timer and CancelAll. Every
    // network exchange of the call observes this token.
    CancelSource cancel;
    std::atomic<bool> done{false};
    std::atomic<int> attempt{0};
    std::atomic<bool> reached_backend{false}; // a POST was handed to the transport

    // Only touched on the delivery thread.
    boost::asio::steady_timer retry_timer;
    boost::asio::steady_timer failsafe_timer;

    std::mutex mu;
    CancelRegistration user_link; // guarded by mu
};

RequestExecutor::RequestExecutor(const ClientOptions& opts,
                                 http::Url backend,
                                 http::IHttpTransport& transport,
                                 DeliveryContext& delivery,
                                 MetricsRegistry& metrics,
                                 const ICredentialStore* credentials,
                                 resilience::CircuitBreaker& breaker,
                                 resilience::RetryPolicy& retry,
                                 resilience::RequestDeduplicator& dedup,
                                 Preflight& preflight,
                                 Clock clock)
    : opts_(opts),
      backend_(std::move(backend)),
      transport_(transport),
      delivery_(delivery),
      metrics_(metrics),
      credentials_(credentials),
      breaker_(breaker),
      retry_(retry),
      dedup_(dedup),
      preflight_(preflight),
      clock_(std::move(clock)) {}

RequestExecutor::~RequestExecutor() {
    CancelAll();
}

void RequestExecutor::Execute(const RewriteParams& params, CancelToken cancel,
                              ProgressCallback on_progress, CompletionCallback on_complete) {
    if (wire::Trim(params.text).empty()) {
        Reject(Operation::rewrite, on_complete, ApiError::InvalidRequest("text is empty"));
        return;
    }
    if (!InUnitRange(params.tone) || !InUnitRange(params.length)) {
        Reject(Operation::rewrite, on_complete, ApiError::InvalidRequest("tone and length must be within [0, 1]"));
        return;
    }
    Submit(Operation::rewrite, std::string(wire::kRewritePath), wire::EncodeRewrite(params, opts_.locale),
           RequestKey(params), std::move(cancel), std::move(on_progress), std::move(on_complete));
}

void RequestExecutor::Execute(const ChatParams& params, CancelToken cancel,
                              ProgressCallback on_progress, CompletionCallback on_complete) {
    if (wire::Trim(params.query).empty()) {
        Reject(Operation::chat, on_complete, ApiError::InvalidRequest("query is empty"));
        return;
    }
    Submit(Operation::chat, std::string(wire::kChatPath), wire::EncodeChat(params),
           RequestKey(params), std::move(cancel), std::move(on_progress), std::move(on_complete));
}

void RequestExecutor::Submit(Operation op, std::string path, std::string body, std::string dedup_key,
                             CancelToken cancel, ProgressCallback on_progress, CompletionCallback on_complete) {
    if (dedup_.IsDuplicate(dedup_key)) {
        keyco::log::info("{}: duplicate of an in-flight request suppressed (key={})", ToString(op), dedup_key);
        metrics_.GetCounter("keyco_dedup_suppressed_total", "Requests suppressed as duplicates").Inc();
        if (on_progress) {
            delivery_.Post([cb = std::move(on_progress)] { cb(kDuplicateProgress); });
        }
        return;
    }

    auto call = std::make_shared<Call>(delivery_.io());
    call->id = next_id_.fetch_add(1, std::memory_order_relaxed);
    call->op = op;
    call->path = std::move(path);
    call->body = std::move(body);
    call->dedup_key = std::move(dedup_key);
    call->on_progress = std::move(on_progress);
    call->on_complete = std::move(on_complete);
    call->started = Now(clock_);

    keyco::log::debug("{}#{}: accepted, body {} bytes", ToString(op), call->id, call->body.size());
    Start(call, std::move(cancel));
}

void RequestExecutor::Start(const CallPtr& call, CancelToken user_cancel) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        active_.emplace(call->id, call);
    }

    // Posted before anything that can complete the call, so the completion's
    // timer cleanup always runs after the timer is armed.
    delivery_.Post([this, call] {
        if (call->done.load()) {
            return;
        }
        call->failsafe_timer.expires_after(opts_.failsafe_timeout);
        call->failsafe_timer.async_wait([this, call](const boost::system::error_code& ec) {
            if (ec || call->done.load()) {
                return;
            }
            const int attempt = call->attempt.load();
            keyco::log::warn("{}#{}: no completion after {}ms at attempt {}, failing", ToString(call->op),
                call->id, opts_.failsafe_timeout.count(), attempt);
            auto error = ApiError::Timeout("fail-safe timer expired");
            if (attempt > 0) {
                error = error.WithRetries(attempt);
            }
            // A backend that never answers is a failure like any other; a stall
            // in the connectivity or health check is not the backend's.
            Complete(call, std::move(error), call->reached_backend.load());
            call->cancel.Cancel();
        });
    });

    // Runs synchronously when the token is already cancelled.
    std::weak_ptr<Call> weak = call;
    auto link = user_cancel.OnCancel([this, weak] {
        if (auto c = weak.lock()) {
            CancelCall(c, true);
        }
    });
    {
        std::lock_guard<std::mutex> lk(call->mu);
        if (!call->done.load()) {
            call->user_link = std::move(link);
        }
    }

    RunAttempt(call, 0);
}

void RequestExecutor::RunAttempt(const CallPtr& call, int attempt) {
    if (call->done.load() || call->cancel.cancelled()) {
        return;
    }
    call->attempt.store(attempt);
    keyco::log::debug("{}#{}: attempt {}", ToString(call->op), call->id, attempt);

    // Retries already passed the connectivity gate.
    if (attempt > 0 || !opts_.preflight.connectivity_check) {
        GateBreaker(call, attempt);
        return;
    }

    preflight_.CheckConnectivity(call->cancel.token(), [this, call, attempt](bool ok) {
        if (call->done.load() || call->cancel.cancelled()) {
            return;
        }
        if (!ok) {
            keyco::log::warn("{}#{}: no connectivity", ToString(call->op), call->id);
            Complete(call, ApiError::NoConnectivity());
            return;
        }
        GateBreaker(call, attempt);
    });
}

void RequestExecutor::GateBreaker(const CallPtr& call, int attempt) {
    auto state = breaker_.CurrentState();

    if (state.open()) {
        keyco::log::info("{}#{}: breaker open, probing backend health", ToString(call->op), call->id);
        preflight_.CheckBackendHealth(call->cancel.token(), [this, call, attempt](bool healthy) {
            if (call->done.load() || call->cancel.cancelled()) {
                return;
            }
            if (!healthy) {
                Complete(call, ApiError::BackendUnavailable());
                return;
            }
            keyco::log::info("{}#{}: backend healthy, resetting breaker", ToString(call->op), call->id);
            breaker_.Reset();
            Send(call, attempt, false);
        });
        return;
    }

    if (state.half_open()) {
        if (!breaker_.TryAcquireProbe()) {
            keyco::log::info("{}#{}: half-open trial already in flight", ToString(call->op), call->id);
            Complete(call, ApiError::CircuitOpen());
            return;
        }
        Send(call, attempt, true);
        return;
    }

    Send(call, attempt, false);
}

void RequestExecutor::Send(const CallPtr& call, int attempt, bool holds_probe) {
    http::HttpRequest req;
    req.method = http::Method::post;
    req.url = backend_.WithPath(call->path);
    req.body = call->body;
    req.content_type = std::string(wire::kJsonContentType);
    if (credentials_ != nullptr) {
        if (auto secret = credentials_->Get()) {
            req.headers["Authorization"] = "Bearer " + *secret;
        }
    }

    call->reached_backend.store(true);
    transport_.AsyncSend(std::move(req), opts_.request_timeout, call->cancel.token(),
        [this, call, attempt, holds_probe](keyco::Result<http::HttpResponse> r) {
            OnResponse(call, attempt, holds_probe, std::move(r));
        });
}

void RequestExecutor::OnResponse(const CallPtr& call, int attempt, bool holds_probe,
                                 keyco::Result<http::HttpResponse> r) {
    const char* op = ToString(call->op);

    if (!r.ok()) {
        auto error = ClassifyTransportFailure(r.status());
        keyco::log::info("{}#{}: attempt {} transport failure: {}", op, call->id, attempt, error.ToString());
        if (error.kind() == ApiErrorKind::cancelled) {
            if (holds_probe) {
                breaker_.ReleaseProbe();
            }
            Complete(call, std::move(error));
            return;
        }
        OnFailure(call, attempt, holds_probe, std::move(error));
        return;
    }

    const auto& resp = r.value();
    keyco::log::info("{}#{}: attempt {} status {}", op, call->id, attempt, resp.status);
    if (resp.status < 200 || resp.status >= 300) {
        OnFailure(call, attempt, holds_probe, ClassifyHttpStatus(resp.status, resp.body));
        return;
    }

    breaker_.RecordSuccess();
    auto result = wire::DecodeCompletion(resp.status, resp.body);
    if (!result.ok()) {
        keyco::log::warn("{}#{}: {}", op, call->id, result.error().ToString());
    }
    Complete(call, std::move(result));
}

void RequestExecutor::OnFailure(const CallPtr& call, int attempt, bool holds_probe, ApiError error) {
    if (retry_.ShouldRetry(error, attempt) && !call->done.load() && !call->cancel.cancelled()) {
        if (holds_probe) {
            breaker_.ReleaseProbe();
        }
        auto delay = retry_.Delay(attempt);
        keyco::log::info("{}#{}: retrying attempt {} in {}ms after {}", ToString(call->op), call->id,
            attempt + 1, delay.count(), error.ToString());
        metrics_.GetCounter("keyco_retries_total", "Scheduled retries", {{"operation", ToString(call->op)}}).Inc();
        ScheduleRetry(call, attempt + 1, delay);
        return;
    }

    // Only an exhausted ladder is annotated; a non-retryable answer after a
    // retry is reported as it came.
    if (attempt > 0 && attempt >= retry_.max_retries()) {
        error = error.WithRetries(attempt);
    }
    if (!Complete(call, std::move(error), true) && holds_probe) {
        breaker_.ReleaseProbe();
    }
}

void RequestExecutor::ScheduleRetry(const CallPtr& call, int attempt, std::chrono::milliseconds delay) {
    delivery_.Post([this, call, attempt, delay] {
        if (call->done.load()) {
            return;
        }
        call->retry_timer.expires_after(delay);
        call->retry_timer.async_wait([this, call, attempt](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            RunAttempt(call, attempt);
        });
    });
}

void RequestExecutor::CancelCall(const CallPtr& call, bool forget_key) {
    if (call->done.load()) {
        return;
    }
    keyco::log::info("{}#{}: cancelled", ToString(call->op), call->id);
    if (forget_key) {
        dedup_.Forget(call->dedup_key);
    }
    Complete(call, ApiError::Cancelled());
    call->cancel.Cancel();
}

bool RequestExecutor::Complete(const CallPtr& call, ApiResult result, bool count_failure) {
    if (call->done.exchange(true)) {
        keyco::log::debug("{}#{}: late completion dropped", ToString(call->op), call->id);
        return false;
    }
    if (count_failure) {
        breaker_.RecordFailure();
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        active_.erase(call->id);
    }
    {
        std::lock_guard<std::mutex> lk(call->mu);
        call->user_link.Reset();
    }

    RecordOutcome(call->op, result, call->started);
    if (result.ok()) {
        keyco::log::info("{}#{}: completed, {} chars", ToString(call->op), call->id, result.value().text.size());
    } else {
        keyco::log::info("{}#{}: failed: {}", ToString(call->op), call->id, result.error().ToString());
    }

    delivery_.Post([call, result = std::move(result)]() mutable {
        call->retry_timer.cancel();
        call->failsafe_timer.cancel();
        if (call->on_complete) {
            call->on_complete(std::move(result));
        }
    });
    return true;
}

void RequestExecutor::Reject(Operation op, const CompletionCallback& on_complete, ApiError error) {
    keyco::log::info("{}: rejected: {}", ToString(op), error.ToString());
    ApiResult result(std::move(error));
    RecordOutcome(op, result, Now(clock_));
    if (on_complete) {
        delivery_.Post([cb = on_complete, result = std::move(result)]() mutable { cb(std::move(result)); });
    }
}

void RequestExecutor::RecordOutcome(Operation op, const ApiResult& result, TimePoint started) {
    const char* outcome = result.ok() ? "ok" : ToString(result.error().kind());
    metrics_.GetCounter("keyco_requests_total", "Completed requests by outcome",
                        {{"operation", ToString(op)}, {"outcome", outcome}})
        .Inc();

    auto elapsed = std::chrono::duration<double, std::milli>(Now(clock_) - started).count();
    metrics_.GetHistogram("keyco_request_latency_ms", "Time from acceptance to completion",
                          LatencyBuckets(), {{"operation", ToString(op)}})
        .Observe(elapsed);

    metrics_.GetGauge("keyco_breaker_open", "1 while the circuit breaker is open")
        .Set(breaker_.CurrentState().open() ? 1.0 : 0.0);
}

void RequestExecutor::CancelAll() {
    std::vector<CallPtr> calls;
    {
        std::lock_guard<std::mutex> lk(mu_);
        calls.reserve(active_.size());
        for (auto& [id, call] : active_) {
            calls.push_back(call);
        }
    }
    for (auto& call : calls) {
        CancelCall(call, false);
    }
}

std::size_t RequestExecutor::in_flight() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_.size();
}

} // namespace keyco::client

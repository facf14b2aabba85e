#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <keyco/client/client_options.h>
#include <keyco/client/credential_store.h>
#include <keyco/client/preflight.h>
#include <keyco/client/types.h>
#include <keyco/core/cancel.h>
#include <keyco/core/clock.h>
#include <keyco/core/metrics.h>
#include <keyco/http/transport.h>
#include <keyco/http/url.h>
#include <keyco/resilience/circuit_breaker.h>
#include <keyco/resilience/deduplicator.h>
#include <keyco/resilience/retry.h>
#include <keyco/runtime/delivery_context.h>

namespace keyco::client {

// Drives one logical request through validation, dedup, preflight, the
// breaker gate, the HTTP call and retries, and delivers exactly one
// completion on the delivery context.
//
// The collaborators are borrowed and must outlive the executor. Handlers still
// queued on the I/O pool or the delivery context refer to the executor, so
// both must be stopped before it is destroyed.
class RequestExecutor {
public:
    RequestExecutor(const ClientOptions& opts,
                    http::Url backend,
                    http::IHttpTransport& transport,
                    DeliveryContext& delivery,
                    MetricsRegistry& metrics,
                    const ICredentialStore* credentials,
                    resilience::CircuitBreaker& breaker,
                    resilience::RetryPolicy& retry,
                    resilience::RequestDeduplicator& dedup,
                    Preflight& preflight,
                    Clock clock = {});
    ~RequestExecutor();

    RequestExecutor(const RequestExecutor&) = delete;
    RequestExecutor& operator=(const RequestExecutor&) = delete;

    // Thread-safe. A suppressed duplicate gets on_progress and no completion.
    void Execute(const RewriteParams& params, CancelToken cancel,
                 ProgressCallback on_progress, CompletionCallback on_complete);
    void Execute(const ChatParams& params, CancelToken cancel,
                 ProgressCallback on_progress, CompletionCallback on_complete);

    // Thread-safe. Completes every in-flight request with cancelled.
    void CancelAll();

    // Thread-safe
    std::size_t in_flight() const;

private:
    struct Call;
    using CallPtr = std::shared_ptr<Call>;

    void Submit(Operation op, std::string path, std::string body, std::string dedup_key,
                CancelToken cancel, ProgressCallback on_progress, CompletionCallback on_complete);
    void Start(const CallPtr& call, CancelToken user_cancel);

    void RunAttempt(const CallPtr& call, int attempt);
    void GateBreaker(const CallPtr& call, int attempt);
    void Send(const CallPtr& call, int attempt, bool holds_probe);
    void OnResponse(const CallPtr& call, int attempt, bool holds_probe, keyco::Result<http::HttpResponse> r);
    void OnFailure(const CallPtr& call, int attempt, bool holds_probe, ApiError error);
    void ScheduleRetry(const CallPtr& call, int attempt, std::chrono::milliseconds delay);

    void CancelCall(const CallPtr& call, bool forget_key);
    // Delivers `result` unless the call already completed; returns whether it
    // did. count_failure records the outcome against the breaker, at most once.
    bool Complete(const CallPtr& call, ApiResult result, bool count_failure = false);
    void Reject(Operation op, const CompletionCallback& on_complete, ApiError error);
    void RecordOutcome(Operation op, const ApiResult& result, TimePoint started);

    ClientOptions opts_;
    http::Url backend_;
    http::IHttpTransport& transport_;
    DeliveryContext& delivery_;
    MetricsRegistry& metrics_;
    const ICredentialStore* credentials_;
    resilience::CircuitBreaker& breaker_;
    resilience::RetryPolicy& retry_;
    resilience::RequestDeduplicator& dedup_;
    Preflight& preflight_;
    Clock clock_;

    std::atomic<std::uint64_t> next_id_{1};
    mutable std::mutex mu_;
    std::unordered_map<std::uint64_t, CallPtr> active_;
};

} // namespace keyco::client

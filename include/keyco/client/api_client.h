#pragma once

#include <functional>
#include <future>
#include <memory>

#include <keyco/client/client_options.h>
#include <keyco/client/credential_store.h>
#include <keyco/client/preflight.h>
#include <keyco/client/request_executor.h>
#include <keyco/client/types.h>
#include <keyco/core/cancel.h>
#include <keyco/core/clock.h>
#include <keyco/core/metrics.h>
#include <keyco/http/transport.h>
#include <keyco/resilience/circuit_breaker.h>
#include <keyco/resilience/deduplicator.h>
#include <keyco/resilience/retry.h>
#include <keyco/runtime/delivery_context.h>

namespace keyco::client {

// Client of the text-generation backend. One instance per process; it owns the
// breaker and the dedup table, so every caller must share it.
//
// Callbacks run on the delivery context. Stop the I/O pool and the delivery
// context before destroying the client.
class ApiClient {
public:
    // Throws std::invalid_argument when a configured URL does not parse.
    ApiClient(ClientOptions opts,
              http::IHttpTransport& transport,
              DeliveryContext& delivery,
              MetricsRegistry& metrics,
              const ICredentialStore* credentials = nullptr,
              Clock clock = {});
    ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    // Thread-safe
    void Rewrite(const RewriteParams& params, CompletionCallback on_complete,
                 ProgressCallback on_progress = {}, CancelToken cancel = {});

    // Thread-safe
    void Chat(const ChatParams& params, CompletionCallback on_complete,
              ProgressCallback on_progress = {}, CancelToken cancel = {});

    // Future flavours. A request suppressed as a duplicate never completes, so
    // its future reports std::future_errc::broken_promise.
    std::future<ApiResult> RewriteAsync(const RewriteParams& params, CancelToken cancel = {});
    std::future<ApiResult> ChatAsync(const ChatParams& params, CancelToken cancel = {});

    // Thread-safe. Probes <base>/api/health; the callback runs on the delivery
    // context with true only for HTTP 200.
    void CheckBackendStatus(std::function<void(bool)> cb, CancelToken cancel = {});

    // Thread-safe. HEAD against the connectivity URL; the callback runs on the
    // delivery context.
    void CheckConnectivity(std::function<void(bool)> cb, CancelToken cancel = {});

    // Thread-safe. Completes every in-flight request with cancelled.
    void CancelAll();

    resilience::CircuitBreaker& breaker() { return breaker_; }
    const ClientOptions& options() const { return opts_; }
    std::size_t in_flight() const { return executor_->in_flight(); }

private:
    ClientOptions opts_;
    DeliveryContext& delivery_;

    resilience::CircuitBreaker breaker_;
    resilience::RetryPolicy retry_;
    resilience::RequestDeduplicator dedup_;
    std::unique_ptr<Preflight> preflight_;
    std::unique_ptr<RequestExecutor> executor_;
};

} // namespace keyco::client

#include <keyco/client/api_client.h>

#include <keyco/core/log.h>

#include <stdexcept>

namespace keyco::client {
namespace {

http::Url ParseOrThrow(const std::string& text, const char* what) {
    auto r = http::Url::Parse(text);
    if (!r.ok()) {
        throw std::invalid_argument(std::string(what) + ": " + r.status().message());
    }
    return std::move(r).value();
}

} // namespace

ApiClient::ApiClient(ClientOptions opts,
                     http::IHttpTransport& transport,
                     DeliveryContext& delivery,
                     MetricsRegistry& metrics,
                     const ICredentialStore* credentials,
                     Clock clock)
    : opts_(std::move(opts)),
      delivery_(delivery),
      breaker_(opts_.breaker, clock),
      retry_(opts_.retry),
      dedup_(opts_.dedup, clock) {
    auto backend = ParseOrThrow(opts_.base_url, "backend.base_url");
    auto connectivity = ParseOrThrow(opts_.preflight.connectivity_url, "preflight.connectivity_url");

    preflight_ = std::make_unique<Preflight>(transport, backend, std::move(connectivity), opts_.preflight, metrics);
    executor_ = std::make_unique<RequestExecutor>(opts_, std::move(backend), transport, delivery, metrics,
        credentials, breaker_, retry_, dedup_, *preflight_, std::move(clock));

    if (auto worst = WorstCaseLatency(opts_); opts_.failsafe_timeout <= worst) {
        keyco::log::warn("fail-safe {}ms does not cover the worst-case retry ladder of {}ms; "
            "slow requests will end on the fail-safe", opts_.failsafe_timeout.count(), worst.count());
    }

    keyco::log::info("api client ready: backend={} retries={} breaker_threshold={}",
        opts_.base_url, opts_.retry.max_retries, opts_.breaker.failure_threshold);
}

ApiClient::~ApiClient() {
    CancelAll();
}

void ApiClient::Rewrite(const RewriteParams& params, CompletionCallback on_complete,
                        ProgressCallback on_progress, CancelToken cancel) {
    executor_->Execute(params, std::move(cancel), std::move(on_progress), std::move(on_complete));
}

void ApiClient::Chat(const ChatParams& params, CompletionCallback on_complete,
                     ProgressCallback on_progress, CancelToken cancel) {
    executor_->Execute(params, std::move(cancel), std::move(on_progress), std::move(on_complete));
}

std::future<ApiResult> ApiClient::RewriteAsync(const RewriteParams& params, CancelToken cancel) {
    auto promise = std::make_shared<std::promise<ApiResult>>();
    auto fut = promise->get_future();
    Rewrite(params, [promise](ApiResult r) { promise->set_value(std::move(r)); }, {}, std::move(cancel));
    return fut;
}

std::future<ApiResult> ApiClient::ChatAsync(const ChatParams& params, CancelToken cancel) {
    auto promise = std::make_shared<std::promise<ApiResult>>();
    auto fut = promise->get_future();
    Chat(params, [promise](ApiResult r) { promise->set_value(std::move(r)); }, {}, std::move(cancel));
    return fut;
}

void ApiClient::CheckBackendStatus(std::function<void(bool)> cb, CancelToken cancel) {
    preflight_->CheckBackendHealth(std::move(cancel), [this, cb = std::move(cb)](bool ok) {
        delivery_.Post([cb, ok] { cb(ok); });
    });
}

void ApiClient::CheckConnectivity(std::function<void(bool)> cb, CancelToken cancel) {
    preflight_->CheckConnectivity(std::move(cancel), [this, cb = std::move(cb)](bool ok) {
        delivery_.Post([cb, ok] { cb(ok); });
    });
}

void ApiClient::CancelAll() {
    executor_->CancelAll();
}

} // namespace keyco::client

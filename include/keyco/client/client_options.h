#pragma once

#include <chrono>
#include <string>

#include <keyco/config/config.h>
#include <keyco/core/status.h>
#include <keyco/http/tls_options.h>
#include <keyco/resilience/circuit_breaker.h>
#include <keyco/resilience/deduplicator.h>
#include <keyco/resilience/retry.h>

namespace keyco::client {

struct PreflightOptions {
    std::string connectivity_url = "https://www.apple.com/";
    bool connectivity_check = true;
    std::chrono::milliseconds connectivity_timeout{3000};
    std::chrono::milliseconds health_timeout{2000};
};

struct ClientOptions {
    std::string base_url = "https://keyco-backend.vercel.app";
    std::chrono::milliseconds request_timeout{15000};
    std::string locale = "en-GB";

    PreflightOptions preflight;
    resilience::CircuitBreakerOptions breaker;
    resilience::RetryOptions retry;
    resilience::DeduplicatorOptions dedup;

    // Ceiling after which a request still without a completion is failed with
    // timeout, whatever the transport is doing. Must stay above
    // WorstCaseLatency() so the retry ladder finishes first.
    std::chrono::milliseconds failsafe_timeout{90000};

    http::TlsOptions tls;
    std::string credential_env = "KEYCO_API_KEY";
    std::string log_level = "info";
};

// Longest a request can run before its last attempt ends: every attempt
// waits out a health check and the request timeout, plus the connectivity
// check and each backoff at full positive jitter.
std::chrono::milliseconds WorstCaseLatency(const ClientOptions& opts);

// Overlays the keys present in `cfg` onto the defaults above. A key with the
// wrong type, a value out of range, or a failsafe_timeout_ms that does not
// exceed WorstCaseLatency() is an invalid_argument error.
keyco::Result<ClientOptions> LoadClientOptions(const config::Config& cfg);

} // namespace keyco::client

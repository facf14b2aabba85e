#include <keyco/client/client_options.h>

#include <keyco/http/url.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace keyco::client {
namespace {

// Each Read* leaves `out` untouched when the key is absent and returns a
// non-ok Status when it is present but unusable.

keyco::Status ReadString(const config::Config& cfg, std::string_view key, std::string& out) {
    if (!cfg.Has(key)) {
        return keyco::Status::Ok();
    }
    auto r = cfg.GetString(key);
    if (!r.ok()) {
        return r.status();
    }
    out = std::move(r).value();
    return keyco::Status::Ok();
}

keyco::Status ReadBool(const config::Config& cfg, std::string_view key, bool& out) {
    if (!cfg.Has(key)) {
        return keyco::Status::Ok();
    }
    auto r = cfg.GetBool(key);
    if (!r.ok()) {
        return r.status();
    }
    out = r.value();
    return keyco::Status::Ok();
}

keyco::Status ReadInt(const config::Config& cfg, std::string_view key, int min_value, int& out) {
    if (!cfg.Has(key)) {
        return keyco::Status::Ok();
    }
    auto r = cfg.GetInt(key);
    if (!r.ok()) {
        return r.status();
    }
    if (r.value() < min_value) {
        return keyco::Status(keyco::StatusCode::invalid_argument,
            "config key " + std::string(key) + " must be >= " + std::to_string(min_value));
    }
    out = r.value();
    return keyco::Status::Ok();
}

keyco::Status ReadMillis(const config::Config& cfg, std::string_view key, std::chrono::milliseconds& out) {
    int v = static_cast<int>(out.count());
    auto st = ReadInt(cfg, key, 0, v);
    if (st.ok()) {
        out = std::chrono::milliseconds(v);
    }
    return st;
}

keyco::Status ReadRatio(const config::Config& cfg, std::string_view key, double& out) {
    if (!cfg.Has(key)) {
        return keyco::Status::Ok();
    }
    auto r = cfg.GetDouble(key);
    if (!r.ok()) {
        return r.status();
    }
    if (r.value() < 0.0 || r.value() > 1.0) {
        return keyco::Status(keyco::StatusCode::invalid_argument,
            "config key " + std::string(key) + " must be within [0, 1]");
    }
    out = r.value();
    return keyco::Status::Ok();
}

} // namespace

std::chrono::milliseconds WorstCaseLatency(const ClientOptions& opts) {
    constexpr double kCap = static_cast<double>(std::numeric_limits<std::int32_t>::max());
    const auto& retry = opts.retry;

    double total = 0.0;
    if (opts.preflight.connectivity_check) {
        total += static_cast<double>(opts.preflight.connectivity_timeout.count());
    }
    const auto per_attempt = static_cast<double>((opts.preflight.health_timeout + opts.request_timeout).count());
    total += per_attempt * (static_cast<double>(retry.max_retries) + 1.0);
    for (int n = 0; n < retry.max_retries && total < kCap; ++n) {
        double backoff = static_cast<double>(retry.base_delay.count()) * std::ldexp(1.0, std::min(n, 30)) *
                         (1.0 + retry.jitter_ratio);
        total += std::max(backoff, static_cast<double>(retry.min_delay.count()));
    }
    return std::chrono::milliseconds(std::llround(std::min(total, kCap)));
}

keyco::Result<ClientOptions> LoadClientOptions(const config::Config& cfg) {
    ClientOptions o;
    int failure_threshold = static_cast<int>(o.breaker.failure_threshold);

    const keyco::Status steps[] = {
        ReadString(cfg, "backend.base_url", o.base_url),
        ReadMillis(cfg, "backend.request_timeout_ms", o.request_timeout),
        ReadString(cfg, "backend.locale", o.locale),

        ReadString(cfg, "preflight.connectivity_url", o.preflight.connectivity_url),
        ReadBool(cfg, "preflight.connectivity_check", o.preflight.connectivity_check),
        ReadMillis(cfg, "preflight.connectivity_timeout_ms", o.preflight.connectivity_timeout),
        ReadMillis(cfg, "preflight.health_timeout_ms", o.preflight.health_timeout),

        ReadInt(cfg, "breaker.failure_threshold", 1, failure_threshold),
        ReadMillis(cfg, "breaker.cooldown_ms", o.breaker.cooldown),
        ReadMillis(cfg, "breaker.half_open_timeout_ms", o.breaker.half_open_timeout),

        ReadInt(cfg, "retry.max_retries", 0, o.retry.max_retries),
        ReadMillis(cfg, "retry.base_delay_ms", o.retry.base_delay),
        ReadRatio(cfg, "retry.jitter_ratio", o.retry.jitter_ratio),
        ReadMillis(cfg, "retry.min_delay_ms", o.retry.min_delay),

        ReadMillis(cfg, "dedup.window_ms", o.dedup.window),
        ReadMillis(cfg, "dedup.retention_ms", o.dedup.retention),

        ReadMillis(cfg, "failsafe_timeout_ms", o.failsafe_timeout),

        ReadBool(cfg, "tls.verify_peer", o.tls.verify_peer),
        ReadString(cfg, "tls.ca_file", o.tls.ca_file),

        ReadString(cfg, "credential_env", o.credential_env),
        ReadString(cfg, "log_level", o.log_level),
    };
    for (const auto& st : steps) {
        if (!st.ok()) {
            return st;
        }
    }
    o.breaker.failure_threshold = static_cast<std::uint32_t>(failure_threshold);

    for (const auto* url : {&o.base_url, &o.preflight.connectivity_url}) {
        auto parsed = http::Url::Parse(*url);
        if (!parsed.ok()) {
            return parsed.status();
        }
    }
    if (o.dedup.retention < o.dedup.window) {
        return keyco::Status(keyco::StatusCode::invalid_argument,
            "dedup.retention_ms must not be shorter than dedup.window_ms");
    }
    if (auto worst = WorstCaseLatency(o); o.failsafe_timeout <= worst) {
        return keyco::Status(keyco::StatusCode::invalid_argument,
            "failsafe_timeout_ms must exceed the worst-case retry ladder of " + std::to_string(worst.count()) + "ms");
    }
    return o;
}

} // namespace keyco::client

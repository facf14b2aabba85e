#pragma once

#include <functional>

#include <keyco/client/client_options.h>
#include <keyco/core/cancel.h>
#include <keyco/core/metrics.h>
#include <keyco/http/transport.h>
#include <keyco/http/url.h>

namespace keyco::client {

// Cheap probes that tell "no network" apart from "backend down" before a full
// request is spent on either.
class Preflight {
public:
    using ProbeCallback = std::function<void(bool ok)>;

    Preflight(http::IHttpTransport& transport,
              http::Url backend,
              http::Url connectivity,
              PreflightOptions opts,
              MetricsRegistry& metrics);

    // Thread-safe. HEAD against the connectivity URL; any 2xx/3xx is ok.
    // The callback runs once, on a transport thread.
    void CheckConnectivity(CancelToken cancel, ProbeCallback cb);

    // Thread-safe. GET <backend>/api/health; only 200 is ok.
    void CheckBackendHealth(CancelToken cancel, ProbeCallback cb);

    const PreflightOptions& options() const { return opts_; }

private:
    void Record(const char* probe, bool ok);

    http::IHttpTransport& transport_;
    http::Url health_url_;
    http::Url connectivity_url_;
    PreflightOptions opts_;
    MetricsRegistry& metrics_;
};

} // namespace keyco::client

#include <keyco/client/preflight.h>

#include <keyco/client/wire.h>
#include <keyco/core/log.h>

namespace keyco::client {

Preflight::Preflight(http::IHttpTransport& transport,
                     http::Url backend,
                     http::Url connectivity,
                     PreflightOptions opts,
                     MetricsRegistry& metrics)
    : transport_(transport),
      health_url_(backend.WithPath(wire::kHealthPath)),
      connectivity_url_(std::move(connectivity)),
      opts_(std::move(opts)),
      metrics_(metrics) {}

void Preflight::CheckConnectivity(CancelToken cancel, ProbeCallback cb) {
    http::HttpRequest req;
    req.method = http::Method::head;
    req.url = connectivity_url_;

    transport_.AsyncSend(std::move(req), opts_.connectivity_timeout, std::move(cancel),
        [this, cb = std::move(cb)](keyco::Result<http::HttpResponse> r) {
            bool ok = false;
            if (r.ok()) {
                ok = r.value().status >= 200 && r.value().status < 400;
                if (!ok) {
                    log::debug("connectivity probe: status {}", r.value().status);
                }
            } else {
                log::debug("connectivity probe: {} {}", keyco::ToString(r.status().code()), r.status().message());
            }
            Record("connectivity", ok);
            cb(ok);
        });
}

void Preflight::CheckBackendHealth(CancelToken cancel, ProbeCallback cb) {
    http::HttpRequest req;
    req.method = http::Method::get;
    req.url = health_url_;

    transport_.AsyncSend(std::move(req), opts_.health_timeout, std::move(cancel),
        [this, cb = std::move(cb)](keyco::Result<http::HttpResponse> r) {
            bool ok = r.ok() && r.value().status == 200;
            if (r.ok()) {
                log::debug("health probe: status {}", r.value().status);
            } else {
                log::debug("health probe: {} {}", keyco::ToString(r.status().code()), r.status().message());
            }
            Record("health", ok);
            cb(ok);
        });
}

void Preflight::Record(const char* probe, bool ok) {
    metrics_.GetCounter("keyco_preflight_total", "Preflight probes by outcome",
                        {{"probe", probe}, {"outcome", ok ? "ok" : "fail"}})
        .Inc();
}

} // namespace keyco::client

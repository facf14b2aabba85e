#pragma once

#include <string>
#include <string_view>

#include <keyco/core/status.h>

namespace keyco::client {

enum class ApiErrorKind {
    network_error,
    http_error,
    invalid_response,
    invalid_request,
    circuit_open,
    timeout,
    no_data,
    no_connectivity,
    backend_unavailable,
    cancelled,
};

const char* ToString(ApiErrorKind kind);

// Closed error taxonomy of the client. The retry directive and the user
// message are pure functions of kind and HTTP status.
class ApiError {
public:
    ApiError() = default;

    static ApiError Network(std::string detail);
    static ApiError Http(int status, std::string detail);
    static ApiError InvalidResponse(std::string detail = {});
    static ApiError InvalidRequest(std::string detail = {});
    static ApiError CircuitOpen();
    static ApiError Timeout(std::string detail = {});
    static ApiError NoData();
    static ApiError NoConnectivity();
    static ApiError BackendUnavailable();
    static ApiError Cancelled();

    ApiErrorKind kind() const { return kind_; }
    int http_status() const { return http_status_; }
    // Diagnostic text for logs; never shown to users.
    const std::string& detail() const { return detail_; }
    // Retries performed before this error became final (0 if none).
    int retries() const { return retries_; }

    bool ShouldRetry() const;

    // Short, user-safe text. Includes the retry annotation when retries() > 0.
    std::string UserMessage() const;

    // Copy annotated with the number of retries that were exhausted.
    ApiError WithRetries(int retries) const;

    // "http_error(503): upstream down" style, for logs.
    std::string ToString() const;

private:
    ApiError(ApiErrorKind kind, int http_status, std::string detail)
        : kind_(kind), http_status_(http_status), detail_(std::move(detail)) {}

    ApiErrorKind kind_ = ApiErrorKind::network_error;
    int http_status_ = 0;
    std::string detail_;
    int retries_ = 0;
};

// User-facing text for an HTTP status, independent of any retry decision.
std::string UserMessageForStatus(int status);

// Transport-level failure (timeout / cancelled / anything else).
ApiError ClassifyTransportFailure(const keyco::Status& status);

// Non-2xx HTTP answer. `body` is searched for an application `error` or
// `details` field to enrich the detail text.
ApiError ClassifyHttpStatus(int status, std::string_view body);

} // namespace keyco::client

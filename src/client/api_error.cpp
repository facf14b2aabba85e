#include <keyco/client/api_error.h>

#include <keyco/client/wire.h>

namespace keyco::client {

const char* ToString(ApiErrorKind kind) {
    switch (kind) {
        case ApiErrorKind::network_error: return "network_error";
        case ApiErrorKind::http_error: return "http_error";
        case ApiErrorKind::invalid_response: return "invalid_response";
        case ApiErrorKind::invalid_request: return "invalid_request";
        case ApiErrorKind::circuit_open: return "circuit_open";
        case ApiErrorKind::timeout: return "timeout";
        case ApiErrorKind::no_data: return "no_data";
        case ApiErrorKind::no_connectivity: return "no_connectivity";
        case ApiErrorKind::backend_unavailable: return "backend_unavailable";
        case ApiErrorKind::cancelled: return "cancelled";
    }
    return "unknown";
}

ApiError ApiError::Network(std::string detail) {
    return ApiError(ApiErrorKind::network_error, 0, std::move(detail));
}

ApiError ApiError::Http(int status, std::string detail) {
    return ApiError(ApiErrorKind::http_error, status, std::move(detail));
}

ApiError ApiError::InvalidResponse(std::string detail) {
    return ApiError(ApiErrorKind::invalid_response, 0, std::move(detail));
}

ApiError ApiError::InvalidRequest(std::string detail) {
    return ApiError(ApiErrorKind::invalid_request, 0, std::move(detail));
}

ApiError ApiError::CircuitOpen() {
    return ApiError(ApiErrorKind::circuit_open, 0, "circuit breaker is open");
}

ApiError ApiError::Timeout(std::string detail) {
    return ApiError(ApiErrorKind::timeout, 0, std::move(detail));
}

ApiError ApiError::NoData() {
    return ApiError(ApiErrorKind::no_data, 0, "empty response body");
}

ApiError ApiError::NoConnectivity() {
    return ApiError(ApiErrorKind::no_connectivity, 0, "connectivity probe failed");
}

ApiError ApiError::BackendUnavailable() {
    return ApiError(ApiErrorKind::backend_unavailable, 0, "backend health probe failed");
}

ApiError ApiError::Cancelled() {
    return ApiError(ApiErrorKind::cancelled, 0, "request cancelled");
}

bool ApiError::ShouldRetry() const {
    switch (kind_) {
        case ApiErrorKind::network_error:
        case ApiErrorKind::timeout:
            return true;
        case ApiErrorKind::http_error:
            return http_status_ == 429 || (http_status_ >= 500 && http_status_ <= 599);
        case ApiErrorKind::invalid_response:
        case ApiErrorKind::invalid_request:
        case ApiErrorKind::circuit_open:
        case ApiErrorKind::no_data:
        case ApiErrorKind::no_connectivity:
        case ApiErrorKind::backend_unavailable:
        case ApiErrorKind::cancelled:
            return false;
    }
    return false;
}

std::string UserMessageForStatus(int status) {
    switch (status) {
        case 400: return "Couldn't process that. Please try again.";
        case 401: return "Authentication problem. Please try again.";
        case 403: return "Access denied. Please try again.";
        case 404: return "Couldn't find that. Please try again.";
        case 429: return "Too many requests. Please wait and try again.";
        case 500:
        case 502:
        case 503: return "AI isn't responding. Please try again.";
        case 504: return "Taking too long. Please try again.";
        default: return "Something went wrong. Please try again.";
    }
}

std::string ApiError::UserMessage() const {
    std::string msg;
    switch (kind_) {
        case ApiErrorKind::network_error: msg = "Connection problem. Please try again."; break;
        case ApiErrorKind::http_error: msg = UserMessageForStatus(http_status_); break;
        case ApiErrorKind::invalid_response: msg = "Something went wrong. Please try again."; break;
        case ApiErrorKind::invalid_request: msg = "Couldn't process that. Please try again."; break;
        case ApiErrorKind::circuit_open: msg = "AI isn't responding. Please try again."; break;
        case ApiErrorKind::timeout: msg = "Taking too long. Please try again."; break;
        case ApiErrorKind::no_data: msg = "No response. Please try again."; break;
        case ApiErrorKind::no_connectivity:
            msg = "No internet. Check your connection and Full Access permission, then try again.";
            break;
        case ApiErrorKind::backend_unavailable: msg = "AI isn't responding. Please try again."; break;
        case ApiErrorKind::cancelled: msg = "Request cancelled."; break;
    }
    if (retries_ > 0) {
        msg += " Retried " + std::to_string(retries_) + (retries_ == 1 ? " time" : " times") + " without success.";
    }
    return msg;
}

ApiError ApiError::WithRetries(int retries) const {
    ApiError copy = *this;
    copy.retries_ = retries;
    return copy;
}

std::string ApiError::ToString() const {
    std::string out = keyco::client::ToString(kind_);
    if (kind_ == ApiErrorKind::http_error) {
        out += "(" + std::to_string(http_status_) + ")";
    }
    if (!detail_.empty()) {
        out += ": " + detail_;
    }
    if (retries_ > 0) {
        out += " [after " + std::to_string(retries_) + " retries]";
    }
    return out;
}

ApiError ClassifyTransportFailure(const keyco::Status& status) {
    switch (status.code()) {
        case keyco::StatusCode::cancelled:
            return ApiError::Cancelled();
        case keyco::StatusCode::timeout:
            return ApiError::Timeout(status.message());
        default:
            return ApiError::Network(status.message());
    }
}

ApiError ClassifyHttpStatus(int status, std::string_view body) {
    return ApiError::Http(status, wire::ExtractErrorMessage(body));
}

} // namespace keyco::client

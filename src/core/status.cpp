#include <keyco/core/status.h>

namespace keyco {

const char* ToString(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

} // namespace keyco

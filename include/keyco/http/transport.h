#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

#include <keyco/core/cancel.h>
#include <keyco/core/status.h>
#include <keyco/http/url.h>

namespace keyco::http {

enum class Method {
    get,
    head,
    post,
};

const char* ToString(Method m);

struct HttpRequest {
    Method method = Method::get;
    Url url;
    std::string body;
    std::string content_type;
    std::unordered_map<std::string, std::string> headers;
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string content_type;
};

// Failures are reported through Status:
//   timeout     - the per-call deadline elapsed
//   cancelled   - the CancelToken fired
//   unavailable - resolve/connect/TLS/read/write failed
using ResponseHandler = std::function<void(keyco::Result<HttpResponse>)>;

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Thread-safe. The handler is called exactly once, on an unspecified
    // thread, possibly before AsyncSend returns.
    virtual void AsyncSend(HttpRequest request,
                           std::chrono::milliseconds timeout,
                           CancelToken cancel,
                           ResponseHandler handler) = 0;
};

} // namespace keyco::http

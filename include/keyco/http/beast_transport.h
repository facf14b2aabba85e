#pragma once

#include <cstddef>

#include <boost/asio/ssl/context.hpp>

#include <keyco/http/tls_options.h>
#include <keyco/http/transport.h>
#include <keyco/runtime/io_context_pool.h>

namespace keyco::http {

// One connection per exchange over Boost.Beast, plain TCP or TLS depending
// on the url scheme. Each exchange is pinned to one io_context of the pool.
class BeastTransport final : public IHttpTransport {
public:
    // Throws std::runtime_error when the CA configuration cannot be loaded.
    BeastTransport(IoContextPool& pool, TlsOptions tls);

    // The pool must be running for the handler to be called.
    void AsyncSend(HttpRequest request,
                   std::chrono::milliseconds timeout,
                   CancelToken cancel,
                   ResponseHandler handler) override;

    static constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

private:
    IoContextPool& pool_;
    TlsOptions tls_;
    boost::asio::ssl::context ssl_ctx_;
};

} // namespace keyco::http

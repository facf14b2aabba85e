#include <keyco/http/beast_transport.h>

#include <keyco/core/log.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace keyco::http {

const char* ToString(Method m) {
    switch (m) {
        case Method::get: return "GET";
        case Method::head: return "HEAD";
        case Method::post: return "POST";
    }
    return "GET";
}

namespace {
namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace beast = boost::beast;
namespace bhttp = beast::http;
using tcp = asio::ip::tcp;

using TlsStream = beast::ssl_stream<beast::tcp_stream>;

bhttp::verb ToVerb(Method m) {
    switch (m) {
        case Method::get: return bhttp::verb::get;
        case Method::head: return bhttp::verb::head;
        case Method::post: return bhttp::verb::post;
    }
    return bhttp::verb::get;
}

std::string HostHeader(const Url& url) {
    bool default_port = (url.tls() && url.port == "443") || (!url.tls() && url.port == "80");
    return default_port ? url.host : url.host + ":" + url.port;
}

// A single request/response exchange. All members are touched only from the
// io_context the session was created on.
template <class Stream>
class ClientSession : public std::enable_shared_from_this<ClientSession<Stream>> {
public:
    static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

    template <class... StreamArgs>
    ClientSession(asio::io_context& ioc,
                  HttpRequest request,
                  std::chrono::milliseconds timeout,
                  CancelToken cancel,
                  ResponseHandler handler,
                  bool verify_host,
                  StreamArgs&&... stream_args)
        : ioc_(ioc),
          resolver_(ioc),
          stream_(std::forward<StreamArgs>(stream_args)...),
          timer_(ioc),
          request_(std::move(request)),
          timeout_(timeout),
          cancel_(std::move(cancel)),
          handler_(std::move(handler)),
          verify_host_(verify_host) {}

    void Start() {
        asio::post(ioc_, [self = this->shared_from_this()] { self->Begin(); });
    }

private:
    using Self = ClientSession<Stream>;

    void Begin() {
        if (cancel_.cancelled()) {
            cancelled_ = true;
            return Finish(keyco::Status(keyco::StatusCode::cancelled, "request cancelled"));
        }

        std::weak_ptr<Self> weak = this->shared_from_this();
        cancel_reg_ = cancel_.OnCancel([weak] {
            if (auto self = weak.lock()) {
                asio::post(self->ioc_, [self] { self->Abort(true); });
            }
        });

        timer_.expires_after(timeout_);
        timer_.async_wait([self = this->shared_from_this()](beast::error_code ec) {
            if (ec) {
                return;
            }
            self->Abort(false);
        });

        resolver_.async_resolve(request_.url.host, request_.url.port,
            beast::bind_front_handler(&Self::OnResolve, this->shared_from_this()));
    }

    // An operation that completed before the abort was seen still stops here.
    bool Aborted() const { return cancelled_ || timed_out_; }

    void Abort(bool by_cancel) {
        if (finished_ || cancelled_ || timed_out_) {
            return;
        }
        (by_cancel ? cancelled_ : timed_out_) = true;
        resolver_.cancel();
        beast::get_lowest_layer(stream_).cancel();
    }

    void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec || Aborted()) {
            return Fail(ec, "resolve");
        }
        beast::get_lowest_layer(stream_).async_connect(results,
            beast::bind_front_handler(&Self::OnConnect, this->shared_from_this()));
    }

    void OnConnect(beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
        if (ec || Aborted()) {
            return Fail(ec, "connect");
        }
        if constexpr (kTls) {
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), request_.url.host.c_str())) {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                return Fail(sni_ec, "tls sni");
            }
            if (verify_host_) {
                stream_.set_verify_callback(ssl::host_name_verification(request_.url.host));
            }
            stream_.async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&Self::OnHandshake, this->shared_from_this()));
        } else {
            Write();
        }
    }

    void OnHandshake(beast::error_code ec) {
        if (ec || Aborted()) {
            return Fail(ec, "tls handshake");
        }
        Write();
    }

    void Write() {
        req_.method(ToVerb(request_.method));
        req_.target(request_.url.target);
        req_.version(11);
        req_.keep_alive(false);
        req_.set(bhttp::field::host, HostHeader(request_.url));
        req_.set(bhttp::field::user_agent, "keyco/0.1");
        req_.set(bhttp::field::accept, "application/json");
        req_.set(bhttp::field::cache_control, "no-cache");
        if (!request_.content_type.empty()) {
            req_.set(bhttp::field::content_type, request_.content_type);
        }
        for (const auto& h : request_.headers) {
            req_.set(h.first, h.second);
        }
        req_.body() = std::move(request_.body);
        req_.prepare_payload();

        bhttp::async_write(stream_, req_,
            beast::bind_front_handler(&Self::OnWrite, this->shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t) {
        if (ec || Aborted()) {
            return Fail(ec, "write");
        }
        parser_.emplace();
        parser_->body_limit(BeastTransport::kMaxBodyBytes);
        if (request_.method == Method::head) {
            parser_->skip(true);
        }
        bhttp::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&Self::OnRead, this->shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec || Aborted()) {
            return Fail(ec, "read");
        }

        auto res = parser_->release();
        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.body = std::move(res.body());
        if (auto it = res.find(bhttp::field::content_type); it != res.end()) {
            out.content_type = std::string(it->value().data(), it->value().size());
        }

        // Connection: close was requested; skip the TLS close_notify round trip.
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);

        Finish(std::move(out));
    }

    void Fail(beast::error_code ec, const char* what) {
        if (cancelled_) {
            return Finish(keyco::Status(keyco::StatusCode::cancelled, "request cancelled"));
        }
        if (timed_out_) {
            return Finish(keyco::Status(keyco::StatusCode::timeout,
                "no response within " + std::to_string(timeout_.count()) + "ms"));
        }
        Finish(keyco::Status(keyco::StatusCode::unavailable, std::string(what) + ": " + ec.message()));
    }

    void Finish(keyco::Result<HttpResponse> result) {
        if (finished_) {
            return;
        }
        finished_ = true;
        timer_.cancel();
        cancel_reg_.Reset();
        auto handler = std::move(handler_);
        handler(std::move(result));
    }

    asio::io_context& ioc_;
    tcp::resolver resolver_;
    Stream stream_;
    asio::steady_timer timer_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::string_body> req_;
    std::optional<bhttp::response_parser<bhttp::string_body>> parser_;

    HttpRequest request_;
    std::chrono::milliseconds timeout_;
    CancelToken cancel_;
    CancelRegistration cancel_reg_;
    ResponseHandler handler_;
    bool verify_host_ = false;

    bool finished_ = false;
    bool cancelled_ = false;
    bool timed_out_ = false;
};

} // namespace

BeastTransport::BeastTransport(IoContextPool& pool, TlsOptions tls)
    : pool_(pool), tls_(std::move(tls)), ssl_ctx_(ssl::context::tls_client) {
    beast::error_code ec;
    if (!tls_.verify_peer) {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
        keyco::log::warn("TLS peer verification is disabled");
        return;
    }

    ssl_ctx_.set_verify_mode(ssl::verify_peer, ec);
    if (!ec) {
        if (tls_.ca_file.empty()) {
            ssl_ctx_.set_default_verify_paths(ec);
        } else {
            ssl_ctx_.load_verify_file(tls_.ca_file, ec);
        }
    }
    if (ec) {
        throw std::runtime_error("tls setup failed: " + ec.message());
    }
}

void BeastTransport::AsyncSend(HttpRequest request,
                               std::chrono::milliseconds timeout,
                               CancelToken cancel,
                               ResponseHandler handler) {
    auto& ioc = pool_.Next();
    if (request.url.tls()) {
        auto session = std::make_shared<ClientSession<TlsStream>>(
            ioc, std::move(request), timeout, std::move(cancel), std::move(handler),
            tls_.verify_peer, ioc, ssl_ctx_);
        session->Start();
        return;
    }

    auto session = std::make_shared<ClientSession<beast::tcp_stream>>(
        ioc, std::move(request), timeout, std::move(cancel), std::move(handler),
        false, ioc);
    session->Start();
}

} // namespace keyco::http

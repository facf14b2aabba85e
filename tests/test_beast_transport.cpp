#include <chtest.hpp>

#include <keyco/core/cancel.h>
#include <keyco/core/status.h>
#include <keyco/http/beast_transport.h>
#include <keyco/http/url.h>
#include <keyco/runtime/io_context_pool.h>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using keyco::http::BeastTransport;
using keyco::http::HttpRequest;
using keyco::http::HttpResponse;
using keyco::http::Method;

namespace {

// Plain HTTP server on 127.0.0.1 for a single connection. It reads one
// request and answers with `response`, or holds the connection open without
// answering when `response` is empty.
class LoopbackServer {
public:
    explicit LoopbackServer(std::string response)
        : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          socket_(io_),
          response_(std::move(response)) {
        acceptor_.async_accept(socket_, [this](const boost::system::error_code& ec) {
            if (!ec) {
                ReadHead();
            }
        });
        thread_ = std::thread([this] { io_.run(); });
    }

    ~LoopbackServer() {
        io_.stop();
        thread_.join();
    }

    keyco::http::Url Url(const std::string& target) const {
        auto url = keyco::http::Url::Parse("http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) +
                                           target);
        if (!url.ok()) {
            throw std::runtime_error("bad loopback url: " + url.status().message());
        }
        return url.value();
    }

    // True once a full request has arrived.
    bool WaitForRequest(std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
        return received_fut_.wait_for(limit) == std::future_status::ready;
    }

    std::string head() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_;
    }

    std::string body() const {
        std::lock_guard<std::mutex> lk(mu_);
        return body_;
    }

private:
    void ReadHead() {
        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
            [this](const boost::system::error_code& ec, std::size_t n) {
                if (ec) {
                    return;
                }
                auto begin = asio::buffers_begin(buffer_.data());
                std::string head(begin, begin + static_cast<std::ptrdiff_t>(n));
                buffer_.consume(n);
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    head_ = head;
                }

                std::size_t length = 0;
                if (auto pos = head.find("Content-Length: "); pos != std::string::npos) {
                    length = static_cast<std::size_t>(std::strtoul(head.c_str() + pos + 16, nullptr, 10));
                }
                std::size_t missing = length > buffer_.size() ? length - buffer_.size() : 0;
                asio::async_read(socket_, buffer_, asio::transfer_exactly(missing),
                    [this, length](const boost::system::error_code& ec, std::size_t) {
                        if (ec) {
                            return;
                        }
                        auto begin = asio::buffers_begin(buffer_.data());
                        {
                            std::lock_guard<std::mutex> lk(mu_);
                            body_.assign(begin, begin + static_cast<std::ptrdiff_t>(length));
                        }
                        received_.set_value();
                        Answer();
                    });
            });
    }

    void Answer() {
        if (response_.empty()) {
            // Keep the read pending so the connection stays open until the
            // client gives up.
            asio::async_read(socket_, buffer_, [](const boost::system::error_code&, std::size_t) {});
            return;
        }
        asio::async_write(socket_, asio::buffer(response_), [this](const boost::system::error_code&, std::size_t) {
            boost::system::error_code ignored;
            socket_.shutdown(tcp::socket::shutdown_both, ignored);
        });
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    tcp::socket socket_;
    asio::streambuf buffer_;
    std::string response_;
    std::thread thread_;

    std::promise<void> received_;
    std::future<void> received_fut_ = received_.get_future();

    mutable std::mutex mu_;
    std::string head_;
    std::string body_;
};

std::string Ok(const std::string& content_type, const std::string& body, std::size_t content_length) {
    return "HTTP/1.1 200 OK\r\nContent-Type: " + content_type + "\r\nContent-Length: " +
           std::to_string(content_length) + "\r\nConnection: close\r\n\r\n" + body;
}

// Collects the handler calls of one exchange.
struct Exchange {
    std::atomic<int> calls{0};
    std::promise<keyco::Result<HttpResponse>> done;
    std::future<keyco::Result<HttpResponse>> result = done.get_future();

    keyco::Result<HttpResponse> Wait() {
        if (result.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            throw std::runtime_error("transport never called the handler");
        }
        return result.get();
    }
};

std::shared_ptr<Exchange> Send(BeastTransport& transport, HttpRequest req, std::chrono::milliseconds timeout,
                               keyco::CancelToken cancel = {}) {
    auto ex = std::make_shared<Exchange>();
    transport.AsyncSend(std::move(req), timeout, std::move(cancel), [ex](keyco::Result<HttpResponse> r) {
        if (ex->calls.fetch_add(1) == 0) {
            ex->done.set_value(std::move(r));
        }
    });
    return ex;
}

struct Client {
    Client() : transport(pool, keyco::http::TlsOptions{}) { pool.Start(); }

    keyco::IoContextPool pool{1};
    BeastTransport transport;
};

} // namespace

TEST_CASE("BeastTransport parses a 200 answer to POST") {
    const std::string json = R"({"text":"hello"})";
    LoopbackServer server(Ok("application/json", json, json.size()));
    Client client;

    HttpRequest req;
    req.method = Method::post;
    req.url = server.Url("/api/rewrite");
    req.body = R"({"text":"hi"})";
    req.content_type = "application/json";
    req.headers["Authorization"] = "Bearer loopback";

    auto ex = Send(client.transport, std::move(req), std::chrono::milliseconds(2000));
    auto r = ex->Wait();
    REQUIRE(r.ok());
    REQUIRE(r.value().status == 200);
    REQUIRE(r.value().body == json);
    REQUIRE(r.value().content_type == "application/json");

    auto head = server.head();
    REQUIRE(head.rfind("POST /api/rewrite HTTP/1.1\r\n", 0) == 0);
    REQUIRE(head.find("Content-Type: application/json\r\n") != std::string::npos);
    REQUIRE(head.find("Authorization: Bearer loopback\r\n") != std::string::npos);
    REQUIRE(server.body() == R"({"text":"hi"})");
    REQUIRE(ex->calls.load() == 1);
}

TEST_CASE("BeastTransport does not wait for a body after HEAD") {
    // Content-Length describes the body a GET would get; none follows.
    LoopbackServer server(Ok("text/html", "", 4096));
    Client client;

    HttpRequest req;
    req.method = Method::head;
    req.url = server.Url("/");

    auto ex = Send(client.transport, std::move(req), std::chrono::milliseconds(2000));
    auto r = ex->Wait();
    REQUIRE(r.ok());
    REQUIRE(r.value().status == 200);
    REQUIRE(r.value().body.empty());
    REQUIRE(server.head().rfind("HEAD / HTTP/1.1\r\n", 0) == 0);
}

TEST_CASE("BeastTransport reports timeout when the server never answers") {
    LoopbackServer server("");
    Client client;

    HttpRequest req;
    req.method = Method::get;
    req.url = server.Url("/api/health");

    auto started = std::chrono::steady_clock::now();
    auto ex = Send(client.transport, std::move(req), std::chrono::milliseconds(300));
    auto r = ex->Wait();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    REQUIRE(!r.ok());
    REQUIRE(r.status().code() == keyco::StatusCode::timeout);
    REQUIRE(elapsed.count() >= 250);
    REQUIRE(elapsed.count() < 2000);
    REQUIRE(server.WaitForRequest(std::chrono::milliseconds(0)));
}

TEST_CASE("BeastTransport reports cancelled once when cancelled mid-exchange") {
    LoopbackServer server("");
    Client client;
    keyco::CancelSource cancel;

    HttpRequest req;
    req.method = Method::post;
    req.url = server.Url("/api/chat");
    req.body = R"({"query":"still there?"})";
    req.content_type = "application/json";

    auto ex = Send(client.transport, std::move(req), std::chrono::milliseconds(5000), cancel.token());
    REQUIRE(server.WaitForRequest());
    cancel.Cancel();

    auto r = ex->Wait();
    REQUIRE(!r.ok());
    REQUIRE(r.status().code() == keyco::StatusCode::cancelled);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(ex->calls.load() == 1);
}

TEST_CASE("BeastTransport honours a token cancelled before sending") {
    LoopbackServer server("");
    Client client;
    keyco::CancelSource cancel;
    cancel.Cancel();

    HttpRequest req;
    req.method = Method::get;
    req.url = server.Url("/api/health");

    auto ex = Send(client.transport, std::move(req), std::chrono::milliseconds(2000), cancel.token());
    auto r = ex->Wait();
    REQUIRE(r.status().code() == keyco::StatusCode::cancelled);
    REQUIRE(!server.WaitForRequest(std::chrono::milliseconds(100)));
}

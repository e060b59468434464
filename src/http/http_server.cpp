#include <meshdest/http/http_server.h>

#include <meshdest/core/metrics.h>
#include <meshdest/http/types.h>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <meshdest/core/log.h>

#include <array>
#include <chrono>
#include <future>
#include <mutex>
#include <string_view>
#include <vector>

namespace meshdest::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

constexpr auto kStreamWriteTimeout = std::chrono::seconds(30);
constexpr char kServerName[] = "meshdest/0.1";

std::string_view ExtractPath(std::string_view target) {
    auto q = target.find('?');
    if (q == std::string_view::npos) {
        return target;
    }
    return target.substr(0, q);
}

void CountRequest(const std::string& path, std::string status) {
    meshdest::DefaultMetrics()
        .CounterMetric("http_server_requests_total", "HTTP server requests total",
                       MetricLabels{{{"path", path}, {"status", std::move(status)}}})
        .Inc(1);
}

http::response<http::string_body> BuildResponse(Response resp, unsigned version, bool keep_alive) {
    http::response<http::string_body> out{http::status(resp.status), version};
    out.keep_alive(keep_alive);
    out.set(http::field::server, kServerName);
    out.set(http::field::content_type, resp.content_type);
    for (const auto& h : resp.headers) {
        out.set(h.first, h.second);
    }
    out.body() = std::move(resp.body);
    out.prepare_payload();
    return out;
}

// One connection. Plain routes are answered inline on the connection's
// strand; stream routes hand the session to their handler as a
// ResponseStream and stop reading requests.
class HttpSession final : public ResponseStream, public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, const Router& router)
        : stream_(std::move(socket)), router_(router) {}

    void Run() {
        Read();
    }

    bool Reply(Response resp) override {
        auto sp = std::make_shared<http::response<http::string_body>>(BuildResponse(std::move(resp), version_, false));
        auto ec = RunOnStrand([this, sp](Done done) {
            http::async_write(stream_, *sp, [self = shared_from_this(), sp, done](beast::error_code ec, std::size_t) {
                beast::error_code ignored;
                self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
                done(ec);
            });
        });
        return !ec;
    }

    bool WriteHead(unsigned status, std::string content_type,
                   std::unordered_map<std::string, std::string> headers) override {
        auto res = std::make_shared<http::response<http::empty_body>>(http::status(status), version_);
        res->set(http::field::server, kServerName);
        res->set(http::field::content_type, content_type);
        for (const auto& h : headers) {
            res->set(h.first, h.second);
        }
        res->keep_alive(false);
        res->chunked(true);
        auto sr = std::make_shared<http::response_serializer<http::empty_body>>(*res);

        auto ec = RunOnStrand([this, res, sr](Done done) {
            http::async_write_header(stream_, *sr,
                [self = shared_from_this(), res, sr, done](beast::error_code ec, std::size_t) {
                    if (!ec) {
                        self->WatchPeer();
                    }
                    done(ec);
                });
        });
        return !ec;
    }

    bool WriteChunk(std::string data) override {
        if (data.empty()) {
            return true;
        }
        auto buf = std::make_shared<std::string>(std::move(data));
        auto ec = RunOnStrand([this, buf](Done done) {
            boost::asio::async_write(stream_, http::make_chunk(boost::asio::buffer(*buf)),
                [self = shared_from_this(), buf, done](beast::error_code ec, std::size_t) { done(ec); });
        });
        return !ec;
    }

    void Finish() override {
        auto ec = RunOnStrand([this](Done done) {
            boost::asio::async_write(stream_, http::make_chunk_last(),
                [self = shared_from_this(), done](beast::error_code ec, std::size_t) {
                    beast::error_code ignored;
                    self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
                    done(ec);
                });
        });
        if (ec) {
            meshdest::log::debug("finishing stream failed: {}", ec.message());
        }
    }

    void Abort() override {
        auto ec = RunOnStrand([this](Done done) {
            beast::error_code ignored;
            // Reset instead of FIN so the peer cannot mistake it for an end.
            stream_.socket().set_option(tcp::socket::linger(true, 0), ignored);
            stream_.socket().close(ignored);
            done({});
            NotifyClosed();
        });
        if (ec) {
            meshdest::log::debug("aborting stream failed: {}", ec.message());
        }
    }

    void OnClose(std::function<void()> fn) override {
        {
            std::lock_guard<std::mutex> lk(close_mu_);
            if (!closed_) {
                on_close_.push_back(std::move(fn));
                return;
            }
        }
        fn();
    }

private:
    using Done = std::function<void(beast::error_code)>;

    // Runs `op` on the connection's strand and waits for it to call `done`.
    beast::error_code RunOnStrand(std::function<void(Done)> op) {
        auto promise = std::make_shared<std::promise<beast::error_code>>();
        auto result = promise->get_future();
        boost::asio::post(stream_.get_executor(), [self = shared_from_this(), op = std::move(op), promise] {
            op([promise](beast::error_code ec) { promise->set_value(ec); });
        });
        if (result.wait_for(kStreamWriteTimeout) != std::future_status::ready) {
            return boost::asio::error::timed_out;
        }
        try {
            return result.get();
        } catch (const std::future_error&) {
            // The io_context went away with the operation still queued.
            return boost::asio::error::operation_aborted;
        }
    }

    void Read() {
        req_ = {};
        http::async_read(stream_, buffer_, req_,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            return;
        }

        Request req;
        req.raw = std::move(req_);
        version_ = req.raw.version();
        auto target_sv = std::string_view(req.raw.target().data(), req.raw.target().size());
        req.path = std::string(ExtractPath(target_sv));

        if (const auto* stream_handler = router_.FindStream(req)) {
            CountRequest(req.path, "stream");
            (*stream_handler)(req, shared_from_this());
            return;
        }

        Response resp;
        router_.Handle(req, resp);
        CountRequest(req.path, std::to_string(resp.status));

        auto sp = std::make_shared<http::response<http::string_body>>(
            BuildResponse(std::move(resp), req.raw.version(), req.raw.keep_alive()));
        http::async_write(stream_, *sp,
            beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<void>, beast::error_code ec, std::size_t) {
        if (ec) {
            return;
        }
        if (close) {
            return DoClose();
        }
        Read();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    // A streaming client never sends more than its request; any completion
    // of this read means it went away.
    void WatchPeer() {
        stream_.async_read_some(boost::asio::buffer(peer_buf_),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    self->NotifyClosed();
                    return;
                }
                self->WatchPeer();
            });
    }

    void NotifyClosed() {
        std::vector<std::function<void()>> fns;
        {
            std::lock_guard<std::mutex> lk(close_mu_);
            if (closed_) {
                return;
            }
            closed_ = true;
            fns.swap(on_close_);
        }
        for (auto& fn : fns) {
            fn();
        }
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    const Router& router_;
    unsigned version_ = 11;
    std::array<char, 64> peer_buf_{};

    std::mutex close_mu_;
    bool closed_ = false;
    std::vector<std::function<void()>> on_close_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router)
    : ioc_(ioc), addr_(std::move(addr)), router_(std::move(router)), acceptor_(ioc) {}

void HttpServer::Start() {
    if (auto st = Listen(); !st.ok()) {
        meshdest::log::error("HTTP server on {}:{} not started: {}", addr_.host, addr_.port, st.ToString());
    }
}

meshdest::Status HttpServer::Listen() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return meshdest::Status::Ok();
    }

    auto fail = [this](meshdest::StatusCode code, std::string what, const beast::error_code& ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        running_.store(false, std::memory_order_release);
        return meshdest::Status(code, what + ": " + ec.message());
    };

    beast::error_code ec;
    auto address = boost::asio::ip::make_address(addr_.host, ec);
    if (ec) {
        return fail(meshdest::StatusCode::invalid_argument, "invalid listen address " + addr_.host, ec);
    }
    tcp::endpoint endpoint{address, addr_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return fail(meshdest::StatusCode::unavailable, "acceptor open failed", ec);
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        meshdest::log::warn("acceptor set_option failed: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        return fail(meshdest::StatusCode::unavailable,
                    "cannot bind " + addr_.host + ":" + std::to_string(addr_.port), ec);
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return fail(meshdest::StatusCode::unavailable, "acceptor listen failed", ec);
    }

    auto local = acceptor_.local_endpoint(ec);
    bound_port_.store(ec ? addr_.port : local.port(), std::memory_order_release);

    meshdest::log::info("HTTP server listening on {}:{}", addr_.host, BoundPort());
    DoAccept();
    return meshdest::Status::Ok();
}

void HttpServer::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    beast::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

void HttpServer::DoAccept() {
    acceptor_.async_accept(boost::asio::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (self->running_.load(std::memory_order_relaxed)) {
                    meshdest::log::warn("accept failed: {}", ec.message());
                    self->DoAccept();
                }
                return;
            }

            std::make_shared<HttpSession>(std::move(socket), self->router_)->Run();
            self->DoAccept();
        });
}

} // namespace meshdest::http

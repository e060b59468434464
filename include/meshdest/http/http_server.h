#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>

#include <meshdest/core/status.h>
#include <meshdest/http/router.h>
#include <meshdest/runtime/app.h>

namespace meshdest::http {

struct ListenAddress {
    std::string host;
    std::uint16_t port = 0; // 0 picks an ephemeral port
};

class HttpServer final : public meshdest::IHttpServer, public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router);

    // Logs and leaves the server stopped if Listen() fails.
    void Start() override;
    void Stop() override;

    // Binds and starts accepting. invalid_argument for a bad host, unavailable
    // when the socket cannot be bound. A failed server can Listen() again.
    meshdest::Status Listen();

    // Port actually bound; 0 until Start() succeeded.
    std::uint16_t BoundPort() const { return bound_port_.load(std::memory_order_acquire); }

private:
    void DoAccept();

    boost::asio::io_context& ioc_;
    ListenAddress addr_;
    Router router_;

    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
};

} // namespace meshdest::http

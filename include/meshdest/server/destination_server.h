#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>

#include <meshdest/destination/registry.h>
#include <meshdest/http/http_server.h>
#include <meshdest/http/router.h>
#include <meshdest/runtime/app.h>

namespace meshdest::server {

// Serves the destination streaming API over HTTP:
//
//   POST /api/v1/Get   body: GetDestination, response: chunked Update frames
//   GET  /metrics      Prometheus text
//   GET  /ready        "ok"
//
// Each stream is fed by its own forwarder thread reading the subscription.
class DestinationServer final : public meshdest::IHttpServer {
public:
    // `registry` must outlive the server.
    DestinationServer(boost::asio::io_context& ioc, http::ListenAddress addr, destination::Registry& registry);
    ~DestinationServer() override;

    void Start() override;

    // Start() that reports a listen failure instead of logging it.
    Status Listen();

    // Ends all streams cleanly, then stops listening. Must run while the io
    // threads are still up.
    void Stop() override;

    std::uint16_t BoundPort() const { return http_->BoundPort(); }

    // Thread-safe. Counts forwarders and pending error replies.
    std::size_t active_streams() const;

private:
    http::Router BuildRouter();
    void HandleGet(const http::Request& req, std::shared_ptr<http::ResponseStream> stream);
    void Forward(std::shared_ptr<destination::Subscription> sub, std::shared_ptr<http::ResponseStream> stream,
                 std::string name);
    void RejectAsync(std::shared_ptr<http::ResponseStream> stream, Status status);
    void Release();

    destination::Registry& registry_;
    std::shared_ptr<http::HttpServer> http_;

    mutable std::mutex mu_;
    std::condition_variable idle_cv_;
    std::size_t active_ = 0;
    bool stopping_ = false;
    // Set once Stop() stopped waiting for active_; nothing may start after.
    bool drained_ = false;
};

} // namespace meshdest::server

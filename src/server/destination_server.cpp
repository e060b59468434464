#include <meshdest/server/destination_server.h>

#include <string>
#include <thread>

#include <meshdest/api/destination.pb.h>
#include <meshdest/core/log.h>
#include <meshdest/core/metrics.h>
#include <meshdest/protohttp/protohttp.h>
#include <meshdest/protohttp/update_codec.h>

namespace meshdest::server {

namespace {

void ReplyError(http::ResponseStream& stream, const Status& status) {
    http::Response resp;
    protohttp::WriteErrorToResponse(resp, status);
    if (!stream.Reply(std::move(resp))) {
        log::debug("client went away before the error response");
    }
}

Gauge& StreamsGauge() {
    return DefaultMetrics().GaugeMetric("destination_streams", "Open destination streams");
}

} // namespace

DestinationServer::DestinationServer(boost::asio::io_context& ioc, http::ListenAddress addr,
                                     destination::Registry& registry)
    : registry_(registry), http_(std::make_shared<http::HttpServer>(ioc, std::move(addr), BuildRouter())) {}

DestinationServer::~DestinationServer() {
    Stop();
}

http::Router DestinationServer::BuildRouter() {
    http::Router router;
    router.Use([](const http::Request& req, http::Response& resp, http::Next next) {
        next();
        auto method = req.raw.method_string();
        log::debug("{} {} -> {}", std::string(method.data(), method.size()), req.path, resp.status);
    });
    router.Get("/ready", [](const http::Request&, http::Response& resp) { resp.body = "ok\n"; });
    router.Get("/metrics", [](const http::Request&, http::Response& resp) {
        resp.content_type = "text/plain; version=0.0.4";
        resp.body = DefaultMetrics().ToPrometheusText();
    });
    router.PostStream("/api/v1/Get", [this](const http::Request& req, std::shared_ptr<http::ResponseStream> stream) {
        HandleGet(req, std::move(stream));
    });
    return router;
}

void DestinationServer::Start() {
    if (auto st = Listen(); !st.ok()) {
        log::error("destination server not started: {}", st.ToString());
    }
}

Status DestinationServer::Listen() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = false;
        drained_ = false;
    }
    return http_->Listen();
}

void DestinationServer::Stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }

    // Closing the registry ends every subscription, which lets each
    // forwarder finish its response.
    registry_.Shutdown();
    {
        std::unique_lock<std::mutex> lk(mu_);
        idle_cv_.wait(lk, [&] { return active_ == 0; });
        drained_ = true;
    }
    http_->Stop();
    log::info("destination server stopped");
}

std::size_t DestinationServer::active_streams() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

void DestinationServer::HandleGet(const http::Request& req, std::shared_ptr<http::ResponseStream> stream) {
    api::destination::GetDestination get;
    if (auto st = protohttp::HttpRequestToProto(req.raw.body(), get); !st.ok()) {
        RejectAsync(std::move(stream), std::move(st));
        return;
    }
    auto dst = destination::ParseDestination(get.scheme(), get.path());
    if (!dst.ok()) {
        RejectAsync(std::move(stream), dst.status());
        return;
    }

    {
        std::unique_lock<std::mutex> lk(mu_);
        if (stopping_) {
            lk.unlock();
            RejectAsync(std::move(stream), Status(StatusCode::unavailable, "destination server is shutting down"));
            return;
        }
        ++active_;
    }
    StreamsGauge().Add(1);

    auto sub = registry_.Subscribe(dst.value());
    stream->OnClose([weak = std::weak_ptr<destination::Subscription>(sub)] {
        if (auto s = weak.lock()) {
            s->Cancel();
        }
    });

    auto name = dst.value().ToString();
    log::info("stream opened for {}", name);
    std::thread([this, sub = std::move(sub), stream = std::move(stream), name = std::move(name)]() mutable {
        Forward(std::move(sub), std::move(stream), std::move(name));
    }).detach();
}

// Replies block until the io thread wrote them, so they run off the io thread
// and are counted in active_ like forwarders.
void DestinationServer::RejectAsync(std::shared_ptr<http::ResponseStream> stream, Status status) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (drained_) {
            log::debug("dropping request during shutdown: {}", status.ToString());
            return;
        }
        ++active_;
    }
    std::thread([this, stream = std::move(stream), status = std::move(status)]() mutable {
        ReplyError(*stream, status);
        stream.reset();
        Release();
    }).detach();
}

void DestinationServer::Release() {
    std::lock_guard<std::mutex> lk(mu_);
    --active_;
    idle_cv_.notify_all();
}

void DestinationServer::Forward(std::shared_ptr<destination::Subscription> sub,
                                std::shared_ptr<http::ResponseStream> stream, std::string name) {
    bool streaming = false;
    bool broken = false;
    destination::Delta delta;
    while (!broken && sub->Recv(delta) == destination::RecvResult::delta) {
        if (!streaming) {
            if (!stream->WriteHead(200, std::string(protohttp::kContentType))) {
                broken = true;
                break;
            }
            streaming = true;
        }
        for (const auto& update : protohttp::DeltaToUpdates(delta)) {
            auto frame = protohttp::SerializeFrame(update);
            if (!frame.ok()) {
                log::error("dropping stream for {}: {}", name, frame.status().ToString());
                broken = true;
                break;
            }
            if (!stream->WriteChunk(std::move(frame).value())) {
                broken = true;
                break;
            }
        }
    }

    if (broken) {
        sub->Cancel();
        stream->Abort();
        log::info("stream for {} closed by client", name);
    } else if (sub->cancelled()) {
        log::info("stream for {} cancelled", name);
    } else if (auto st = sub->status(); !st.ok()) {
        if (streaming) {
            // Headers are gone; only a broken connection tells the client
            // this was not a clean end.
            log::warn("aborting stream for {}: {}", name, st.ToString());
            stream->Abort();
        } else {
            log::info("rejecting stream for {}: {}", name, st.ToString());
            ReplyError(*stream, st);
        }
    } else {
        if (!streaming && !stream->WriteHead(200, std::string(protohttp::kContentType))) {
            log::debug("client of {} went away", name);
        }
        stream->Finish();
        log::info("stream for {} ended", name);
    }

    // Nothing of this stream may outlive the server once active_ drops.
    sub.reset();
    stream.reset();
    StreamsGauge().Add(-1);
    Release();
}

} // namespace meshdest::server

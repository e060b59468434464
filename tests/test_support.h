#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <meshdest/destination/address.h>
#include <meshdest/destination/destination.h>
#include <meshdest/destination/endpoint_set.h>
#include <meshdest/destination/resolver.h>
#include <meshdest/destination/subscription.h>

namespace meshdest::testing {

// An io_context running on its own thread for as long as the object lives.
class IoThread {
public:
    IoThread() : guard_(boost::asio::make_work_guard(ioc_)), thread_([this] { ioc_.run(); }) {}

    ~IoThread() {
        guard_.reset();
        ioc_.stop();
        thread_.join();
    }

    boost::asio::io_context& ioc() { return ioc_; }

private:
    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard_;
    std::thread thread_;
};

inline destination::TcpAddress Addr(std::string_view ip, std::uint16_t port) {
    return destination::TcpAddress{destination::IpAddress::Parse(ip).value(), port};
}

inline destination::Endpoint Ep(std::string_view ip, std::uint16_t port) {
    destination::Endpoint ep;
    ep.address = Addr(ip, port);
    return ep;
}

inline destination::Destination Dst(std::string path, std::uint16_t port,
                                    destination::Scheme scheme = destination::Scheme::k8s) {
    return destination::Destination{scheme, std::move(path), port};
}

inline destination::EndpointSet Set(std::vector<destination::Endpoint> eps, std::uint64_t version = 1,
                                    bool exists = true) {
    return destination::EndpointSet(Dst("web.default.svc.cluster.local", 80), version, exists, std::move(eps));
}

inline bool HasAddr(const std::vector<destination::Endpoint>& eps, const destination::TcpAddress& addr) {
    for (const auto& ep : eps) {
        if (ep.address == addr) {
            return true;
        }
    }
    return false;
}

// Receives one delta or gives up after `timeout`.
inline std::optional<destination::Delta> NextDelta(destination::Subscription& sub,
                                                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    destination::Delta d;
    if (sub.RecvFor(timeout, d) == destination::RecvResult::delta) {
        return d;
    }
    return std::nullopt;
}

// Waits until `sub` is closed and fully drained.
inline bool WaitClosed(destination::Subscription& sub, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    destination::Delta d;
    while (std::chrono::steady_clock::now() < deadline) {
        if (sub.RecvFor(std::chrono::milliseconds(20), d) == destination::RecvResult::closed) {
            return true;
        }
    }
    return false;
}

template <class Pred>
bool Eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Resolver driven by the test: every Publish() becomes one emitted snapshot,
// Fail() ends the resolution with an error.
class ScriptedResolver final : public destination::IResolver {
public:
    explicit ScriptedResolver(std::string_view accepts = {}) : accepts_(accepts) {}

    std::string_view Name() const override { return "scripted"; }

    bool CanResolve(const destination::Destination& dst) const override {
        return accepts_.empty() || dst.path == accepts_;
    }

    Status StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                            const destination::DoneSignal& done) override {
        starts_.fetch_add(1);
        done.AddWaker([this] {
            std::lock_guard<std::mutex> lk(mu_);
            cv_.notify_all();
        });

        std::uint64_t version = 0;
        for (;;) {
            std::vector<destination::Endpoint> eps;
            bool exists = true;
            {
                std::unique_lock<std::mutex> lk(mu_);
                cv_.wait(lk, [&] { return done.Fired() || !pending_.empty() || failure_; });
                if (failure_) {
                    stops_.fetch_add(1);
                    return *failure_;
                }
                if (done.Fired()) {
                    stops_.fetch_add(1);
                    return Status::Ok();
                }
                eps = std::move(pending_.front().first);
                exists = pending_.front().second;
                pending_.pop_front();
            }
            emit(destination::EndpointSet(dst, ++version, exists, std::move(eps)));
            emitted_.fetch_add(1);
        }
    }

    void Publish(std::vector<destination::Endpoint> eps, bool exists = true) {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.emplace_back(std::move(eps), exists);
        cv_.notify_all();
    }

    void Fail(Status status) {
        std::lock_guard<std::mutex> lk(mu_);
        failure_ = std::move(status);
        cv_.notify_all();
    }

    int starts() const { return starts_.load(); }
    int stops() const { return stops_.load(); }
    int emitted() const { return emitted_.load(); }

private:
    const std::string accepts_;
    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::pair<std::vector<destination::Endpoint>, bool>> pending_;
    std::optional<Status> failure_;
    std::atomic<int> starts_{0};
    std::atomic<int> stops_{0};
    std::atomic<int> emitted_{0};
};

} // namespace meshdest::testing

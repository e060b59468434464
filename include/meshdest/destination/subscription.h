#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

#include <meshdest/core/status.h>
#include <meshdest/destination/endpoint_set.h>

namespace meshdest::destination {

class Watch;

enum class RecvResult {
    delta,
    closed,
    timeout,
};

// One subscriber's attachment to a Watch. Owned by whoever called
// Registry::Subscribe; the Watch only keeps a weak reference.
//
// Deltas are delivered in the order the Watch produced them. Once closed,
// already buffered deltas are still handed out before Recv reports closed.
class Subscription {
public:
    using Id = std::uint64_t;

    Subscription(Id id, std::size_t capacity, std::weak_ptr<Watch> watch);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // A subscription that is closed from the start, for callers that cannot
    // attach to any Watch.
    static std::shared_ptr<Subscription> MakeClosed(Status status);

    Id id() const { return id_; }

    // Blocks until a delta is available or the subscription is closed.
    RecvResult Recv(Delta& out);

    RecvResult RecvFor(std::chrono::milliseconds timeout, Delta& out);

    // Thread-safe, idempotent. Unblocks pending receives and detaches from
    // the Watch; other subscriptions are unaffected. No-op once closed.
    void Cancel();

    bool closed() const;
    bool cancelled() const;

    // True when the buffer overflowed and deltas were dropped.
    bool stale() const;

    // OK for a clean close or a cancellation; the terminal error otherwise.
    Status status() const;

    // Number of deltas waiting to be received.
    std::size_t pending() const;

private:
    friend class Watch;

    // Called by the owning Watch with its lock held. Never blocks. Returns
    // false if the subscription is (now) closed and should be forgotten.
    bool Push(const Delta& delta);

    // Called by the owning Watch with its lock held.
    void Close(Status status);

    RecvResult PopLocked(Delta& out);

    const Id id_;
    const std::size_t capacity_;
    const std::weak_ptr<Watch> watch_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Delta> queue_;
    bool closed_ = false;
    bool cancelled_ = false;
    bool stale_ = false;
    Status status_;
};

} // namespace meshdest::destination

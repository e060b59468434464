#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <meshdest/core/metrics.h>
#include <meshdest/destination/done_signal.h>
#include <meshdest/destination/endpoint_set.h>
#include <meshdest/destination/resolver.h>
#include <meshdest/destination/subscription.h>

namespace meshdest::destination {

struct WatchOptions {
    // How long a Watch without subscribers keeps its resolver running.
    std::chrono::milliseconds linger{0};
    std::size_t subscription_buffer = 256;
};

enum class WatchState {
    idle,
    resolving,
    active,
    draining,
    closed,
};

std::string_view WatchStateName(WatchState state);

// Per-destination fan-out hub. Runs exactly one resolver on a dedicated
// thread and multiplexes the deltas between its snapshots to every attached
// Subscription.
//
// The io_context passed in drives the linger timer and must outlive the
// Watch.
class Watch : public std::enable_shared_from_this<Watch> {
public:
    using ClosedFn = std::function<void(const std::shared_ptr<Watch>&)>;

    Watch(Destination destination, ResolverList resolvers, WatchOptions options,
          boost::asio::io_context& ioc, ClosedFn on_closed);
    ~Watch();

    Watch(const Watch&) = delete;
    Watch& operator=(const Watch&) = delete;

    const Destination& destination() const { return destination_; }

    // Thread-safe
    WatchState state() const;
    std::size_t subscriber_count() const;
    std::string resolver_name() const;
    bool exited() const;

    // Attaches a new subscriber. The first attach selects a resolver and
    // starts it. A subscriber joining after snapshots were seen receives
    // Diff(nullptr, latest) first. Returns nullptr once the watch is closed.
    std::shared_ptr<Subscription> Attach();

    // Mesh shutdown: stops the resolver; subscriptions see a clean close
    // unless the resolver reports an error.
    void Close();

    // Waits for the resolver thread to finish. No-op on the resolver thread.
    void Join();

private:
    friend class Subscription;

    // Registered once a resolver is selected, removed when the watch finishes.
    struct Metrics {
        MetricLabels labels;
        std::shared_ptr<Gauge> subscribers;
        std::shared_ptr<Gauge> exists;
        std::shared_ptr<Gauge> endpoints;
        std::shared_ptr<Counter> updates;
    };

    void Detach(Subscription::Id id);

    void Run(std::shared_ptr<IResolver> resolver);
    void OnSnapshot(EndpointSet next);
    void Finish(Status status);

    void RegisterMetricsLocked();
    void RemoveMetricsLocked();

    void EnterDrainingLocked();
    void OnLingerExpired(std::uint64_t generation);
    void BeginCloseLocked();

    std::vector<std::shared_ptr<Subscription>> LiveSubscribersLocked();

    const Destination destination_;
    const ResolverList resolvers_;
    const WatchOptions options_;
    const ClosedFn on_closed_;
    Metrics metrics_;

    DoneSignal done_;

    mutable std::mutex mu_;
    std::condition_variable exited_cv_;
    WatchState state_ = WatchState::idle;
    std::shared_ptr<IResolver> resolver_;
    std::thread worker_;
    bool exited_ = true;
    std::optional<EndpointSet> last_;
    Subscription::Id next_id_ = 1;
    std::map<Subscription::Id, std::weak_ptr<Subscription>> subscribers_;
    boost::asio::steady_timer linger_timer_;
    std::uint64_t linger_generation_ = 0;
};

} // namespace meshdest::destination

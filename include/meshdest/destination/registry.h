#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include <meshdest/destination/destination.h>
#include <meshdest/destination/resolver.h>
#include <meshdest/destination/subscription.h>
#include <meshdest/destination/watch.h>

namespace meshdest::destination {

// Owns at most one live Watch per Destination and hands out subscriptions.
//
// `ioc` runs the linger timers and must outlive the Registry.
class Registry {
public:
    Registry(boost::asio::io_context& ioc, ResolverList resolvers, WatchOptions options = {});
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Thread-safe. Never returns nullptr: an unresolvable destination or a
    // registry that was shut down yields an already closed subscription
    // carrying the error.
    std::shared_ptr<Subscription> Subscribe(const Destination& dst);

    // Number of watches currently serving (or lingering for) a destination.
    std::size_t WatchCount() const;

    // Closes every subscription cleanly and waits for all resolvers.
    void Shutdown();

private:
    void OnWatchClosed(const std::shared_ptr<Watch>& watch);
    void ReapRetired();

    boost::asio::io_context& ioc_;
    const ResolverList resolvers_;
    const WatchOptions options_;

    mutable std::mutex mu_;
    bool shutdown_ = false;
    std::unordered_map<Destination, std::shared_ptr<Watch>, DestinationHash> watches_;
    // Closed watches whose resolver thread still has to be joined.
    std::vector<std::shared_ptr<Watch>> retired_;
};

} // namespace meshdest::destination

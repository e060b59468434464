#pragma once

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include <meshdest/core/status.h>
#include <meshdest/destination/destination.h>
#include <meshdest/destination/done_signal.h>
#include <meshdest/destination/endpoint_set.h>

namespace meshdest::destination {

using EmitFn = std::function<void(EndpointSet)>;

// Strategy turning a destination into a live stream of EndpointSets.
class IResolver {
public:
    virtual ~IResolver() = default;

    virtual std::string_view Name() const = 0;

    // Pure and cheap; called once for every new Watch.
    virtual bool CanResolve(const Destination& dst) const = 0;

    // Blocks for the lifetime of the Watch. `emit` is only ever called from
    // the calling thread, with increasing versions. Returns OK once `done`
    // has fired and all resources are released, or an error on an
    // unrecoverable failure. Transient upstream failures are retried
    // internally and never returned.
    virtual Status StreamResolution(const Destination& dst, const EmitFn& emit, const DoneSignal& done) = 0;
};

using ResolverList = std::vector<std::shared_ptr<IResolver>>;

// First resolver, in priority order, that accepts `dst`; nullptr if none.
std::shared_ptr<IResolver> SelectResolver(const ResolverList& resolvers, const Destination& dst);

} // namespace meshdest::destination

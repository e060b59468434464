#pragma once

#include <memory>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/destination/resolver.h>
#include <meshdest/resolvers/resolver_options.h>

namespace meshdest::resolvers {

// "<svc>.<ns>.svc[.<zone>]" names, followed through the local cluster state.
class ServiceResolver final : public destination::IResolver {
public:
    ServiceResolver(std::shared_ptr<cluster::IClusterState> state, ResolverOptions options);

    std::string_view Name() const override { return "service"; }
    bool CanResolve(const destination::Destination& dst) const override;
    Status StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                            const destination::DoneSignal& done) override;

private:
    const std::shared_ptr<cluster::IClusterState> state_;
    const ResolverOptions options_;
};

} // namespace meshdest::resolvers

#pragma once

#include <memory>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/destination/resolver.h>
#include <meshdest/resolvers/resolver_options.h>

namespace meshdest::resolvers {

// Pod-direct "<hostname>.<svc>.<ns>.svc[.<zone>]" names of headless services.
// Resolves to at most one endpoint.
class PodResolver final : public destination::IResolver {
public:
    PodResolver(std::shared_ptr<cluster::IClusterState> state, ResolverOptions options);

    std::string_view Name() const override { return "pod"; }
    bool CanResolve(const destination::Destination& dst) const override;
    Status StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                            const destination::DoneSignal& done) override;

private:
    const std::shared_ptr<cluster::IClusterState> state_;
    const ResolverOptions options_;
};

} // namespace meshdest::resolvers

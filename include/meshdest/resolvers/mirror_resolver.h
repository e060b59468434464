#pragma once

#include <memory>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/cluster/cluster_store.h>
#include <meshdest/destination/resolver.h>
#include <meshdest/resolvers/resolver_options.h>

namespace meshdest::resolvers {

inline constexpr std::string_view kRemoteDiscoveryLabel = "multicluster.linkerd.io/remote-discovery";
inline constexpr std::string_view kRemoteServiceLabel = "multicluster.linkerd.io/remote-service";

// "mirror://" destinations: a local service whose labels name a linked
// cluster and the service to follow there.
class MirrorResolver final : public destination::IResolver {
public:
    MirrorResolver(std::shared_ptr<cluster::IClusterState> local, std::shared_ptr<cluster::ClusterStore> clusters,
                   ResolverOptions options);

    std::string_view Name() const override { return "mirror"; }
    bool CanResolve(const destination::Destination& dst) const override;
    Status StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                            const destination::DoneSignal& done) override;

private:
    const std::shared_ptr<cluster::IClusterState> local_;
    const std::shared_ptr<cluster::ClusterStore> clusters_;
    const ResolverOptions options_;
};

} // namespace meshdest::resolvers

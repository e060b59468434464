#include <meshdest/resolvers/resolvers.h>

#include <meshdest/resolvers/ip_resolver.h>
#include <meshdest/resolvers/mirror_resolver.h>
#include <meshdest/resolvers/pod_resolver.h>
#include <meshdest/resolvers/service_resolver.h>

namespace meshdest::resolvers {

destination::ResolverList DefaultResolvers(std::shared_ptr<cluster::IClusterState> local,
                                           std::shared_ptr<cluster::ClusterStore> clusters,
                                           const ResolverOptions& options) {
    return {
        std::make_shared<IpResolver>(options),
        std::make_shared<MirrorResolver>(local, std::move(clusters), options),
        std::make_shared<PodResolver>(local, options),
        std::make_shared<ServiceResolver>(local, options),
    };
}

} // namespace meshdest::resolvers

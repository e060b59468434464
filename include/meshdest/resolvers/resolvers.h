#pragma once

#include <memory>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/cluster/cluster_store.h>
#include <meshdest/destination/resolver.h>
#include <meshdest/resolvers/resolver_options.h>

namespace meshdest::resolvers {

// The resolver chain in priority order: literal IP, mirror, pod, service.
destination::ResolverList DefaultResolvers(std::shared_ptr<cluster::IClusterState> local,
                                           std::shared_ptr<cluster::ClusterStore> clusters,
                                           const ResolverOptions& options);

} // namespace meshdest::resolvers

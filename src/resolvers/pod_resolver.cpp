#include <meshdest/resolvers/pod_resolver.h>

#include <meshdest/cluster/dns_name.h>
#include <meshdest/resolvers/service_watch.h>
#include <meshdest/resolvers/translation.h>

namespace meshdest::resolvers {

PodResolver::PodResolver(std::shared_ptr<cluster::IClusterState> state, ResolverOptions options)
    : state_(std::move(state)), options_(std::move(options)) {}

bool PodResolver::CanResolve(const destination::Destination& dst) const {
    if (dst.scheme != destination::Scheme::k8s) {
        return false;
    }
    auto name = cluster::ParseServiceName(dst.path, options_.cluster_domain);
    return name.ok() && !name.value().hostname.empty();
}

Status PodResolver::StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                                     const destination::DoneSignal& done) {
    auto name = cluster::ParseServiceName(dst.path, options_.cluster_domain);
    if (!name.ok()) {
        return name.status();
    }
    const auto id = name.value().id;
    const auto hostname = name.value().hostname;

    std::uint64_t version = 0;
    return FollowService(*state_, id, resilience::RetryPolicy(options_.retry), done,
                         [&](const cluster::ServiceState& s) {
                             emit(TranslatePod(dst, ++version, id, hostname, s, options_, options_.trust_domain));
                         });
}

} // namespace meshdest::resolvers

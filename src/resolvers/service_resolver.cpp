#include <meshdest/resolvers/service_resolver.h>

#include <meshdest/cluster/dns_name.h>
#include <meshdest/resolvers/service_watch.h>
#include <meshdest/resolvers/translation.h>

namespace meshdest::resolvers {

ServiceResolver::ServiceResolver(std::shared_ptr<cluster::IClusterState> state, ResolverOptions options)
    : state_(std::move(state)), options_(std::move(options)) {}

bool ServiceResolver::CanResolve(const destination::Destination& dst) const {
    if (dst.scheme != destination::Scheme::k8s) {
        return false;
    }
    auto name = cluster::ParseServiceName(dst.path, options_.cluster_domain);
    return name.ok() && name.value().hostname.empty();
}

Status ServiceResolver::StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                                         const destination::DoneSignal& done) {
    auto name = cluster::ParseServiceName(dst.path, options_.cluster_domain);
    if (!name.ok()) {
        return name.status();
    }
    const auto id = name.value().id;

    std::uint64_t version = 0;
    return FollowService(*state_, id, resilience::RetryPolicy(options_.retry), done,
                         [&](const cluster::ServiceState& s) {
                             emit(TranslateService(dst, ++version, id, s, options_, options_.trust_domain));
                         });
}

} // namespace meshdest::resolvers

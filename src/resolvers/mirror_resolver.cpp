#include <meshdest/resolvers/mirror_resolver.h>

#include <meshdest/cluster/dns_name.h>
#include <meshdest/core/log.h>
#include <meshdest/resolvers/service_watch.h>
#include <meshdest/resolvers/translation.h>

namespace meshdest::resolvers {

MirrorResolver::MirrorResolver(std::shared_ptr<cluster::IClusterState> local,
                               std::shared_ptr<cluster::ClusterStore> clusters, ResolverOptions options)
    : local_(std::move(local)), clusters_(std::move(clusters)), options_(std::move(options)) {}

bool MirrorResolver::CanResolve(const destination::Destination& dst) const {
    if (dst.scheme != destination::Scheme::mirror) {
        return false;
    }
    auto name = cluster::ParseServiceName(dst.path, options_.cluster_domain);
    return name.ok() && name.value().hostname.empty();
}

Status MirrorResolver::StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                                        const destination::DoneSignal& done) {
    auto name = cluster::ParseServiceName(dst.path, options_.cluster_domain);
    if (!name.ok()) {
        return name.status();
    }
    const auto local_id = name.value().id;

    auto service = local_->GetService(local_id);
    if (!service) {
        return Status(StatusCode::not_found, "service " + local_id.ToString() + " not found");
    }
    auto link = service->labels.find(std::string(kRemoteDiscoveryLabel));
    auto remote_name = service->labels.find(std::string(kRemoteServiceLabel));
    if (link == service->labels.end() || remote_name == service->labels.end()) {
        return Status(StatusCode::failed_precondition,
                      "service " + local_id.ToString() + " is not a remote discovery mirror");
    }

    auto remote = clusters_ ? clusters_->Get(link->second)
                            : Result<cluster::RemoteCluster>(
                                  Status(StatusCode::not_found, "no remote clusters linked"));
    if (!remote.ok()) {
        return remote.status();
    }
    const auto linked = std::move(remote).value();
    const cluster::ServiceId remote_id{local_id.ns, remote_name->second};

    log::info("mirroring {} from {} in cluster {}", local_id.ToString(), remote_id.ToString(), link->second);

    std::uint64_t version = 0;
    return FollowService(*linked.state, remote_id, resilience::RetryPolicy(options_.retry), done,
                         [&](const cluster::ServiceState& s) {
                             emit(TranslateService(dst, ++version, remote_id, s, options_, linked.trust_domain));
                         });
}

} // namespace meshdest::resolvers

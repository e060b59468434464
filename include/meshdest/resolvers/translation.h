#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/destination/endpoint_set.h>
#include <meshdest/resolvers/resolver_options.h>

namespace meshdest::resolvers {

// Where a service port sends traffic on its backends.
struct TargetPort {
    std::uint16_t number = 0;
    std::string name;

    bool named() const { return !name.empty(); }
};

// Service annotation listing the service's opaque ports.
inline constexpr std::string_view kOpaquePortsAnnotation = "config.linkerd.io/opaque-ports";

// Ports named by the service's opaque-ports annotation. Entries are port
// numbers, "lo-hi" ranges or names from the service's port table; invalid
// ones are skipped. nullopt when the annotation is absent or names nothing,
// in which case the configured defaults apply.
std::optional<std::set<std::uint16_t>> ServiceOpaquePorts(const cluster::ServiceInfo& service);

// Looks `port` up in the service's port table. Unlisted ports target
// themselves, as does a mapping without an explicit target.
TargetPort MapTargetPort(const cluster::ServiceInfo& service, std::uint16_t port);

// The record's own identity, else one derived from its service account:
// "<sa>.<ns>.serviceaccount.identity.linkerd.<trust_domain>".
std::optional<std::string> EndpointIdentity(const cluster::BackendRecord& record, std::string_view ns,
                                            std::string_view trust_domain);

// Snapshot of a load-balanced service: every ready backend listening on the
// target port. A missing or ExternalName service does not exist.
//
// Endpoints are opaque when the service's annotation lists the requested
// service port, or, without an annotation, when their own port is one of
// options.opaque_ports.
destination::EndpointSet TranslateService(const destination::Destination& dst, std::uint64_t version,
                                          const cluster::ServiceId& id, const cluster::ServiceState& state,
                                          const ResolverOptions& options, std::string_view trust_domain);

// Snapshot of one pod addressed through its headless service, selected by
// hostname regardless of readiness.
destination::EndpointSet TranslatePod(const destination::Destination& dst, std::uint64_t version,
                                      const cluster::ServiceId& id, std::string_view hostname,
                                      const cluster::ServiceState& state, const ResolverOptions& options,
                                      std::string_view trust_domain);

} // namespace meshdest::resolvers

#include <meshdest/resolvers/translation.h>

#include <vector>

#include <meshdest/core/log.h>

namespace meshdest::resolvers {

namespace {

destination::Labels SetLabels(const cluster::ServiceId& id) {
    return {{"namespace", id.ns}, {"service", id.name}};
}

// Decides opaqueness for the endpoints of one snapshot.
class OpaquePolicy {
public:
    OpaquePolicy(const cluster::ServiceInfo& service, std::uint16_t service_port, const ResolverOptions& options)
        : annotated_(ServiceOpaquePorts(service)), service_port_(service_port), defaults_(options.opaque_ports) {}

    bool Opaque(std::uint16_t endpoint_port) const {
        if (annotated_) {
            return annotated_->count(service_port_) != 0;
        }
        return defaults_.count(endpoint_port) != 0;
    }

private:
    std::optional<std::set<std::uint16_t>> annotated_;
    std::uint16_t service_port_;
    const std::set<std::uint16_t>& defaults_;
};

destination::Endpoint ToEndpoint(const cluster::BackendRecord& record, std::uint16_t port,
                                 const cluster::ServiceId& id, const OpaquePolicy& opaque,
                                 std::string_view trust_domain) {
    destination::Endpoint ep;
    ep.address = destination::TcpAddress{record.address, port};
    ep.identity = EndpointIdentity(record, id.ns, trust_domain);
    ep.metric_labels = record.labels;
    if (!record.pod.empty()) {
        ep.metric_labels["pod"] = record.pod;
    }
    ep.hostname = record.hostname;
    ep.opaque_protocol = opaque.Opaque(port);
    return ep;
}

bool ServesTarget(const cluster::BackendRecord& record, const TargetPort& target) {
    return target.named() ? record.port_name == target.name : record.port == target.number;
}

bool Exists(const cluster::ServiceState& state) {
    return state.service.has_value() && !state.service->external_name;
}

} // namespace

std::optional<std::set<std::uint16_t>> ServiceOpaquePorts(const cluster::ServiceInfo& service) {
    auto annotation = service.annotations.find(std::string(kOpaquePortsAnnotation));
    if (annotation == service.annotations.end()) {
        return std::nullopt;
    }

    std::set<std::uint16_t> ports;
    for (auto item : SplitPortList(annotation->second)) {
        // Port names may look like ranges, so they are matched first.
        bool named = false;
        for (const auto& p : service.ports) {
            if (!p.name.empty() && p.name == item) {
                ports.insert(p.port);
                named = true;
                break;
            }
        }
        if (named) {
            continue;
        }
        auto range = ParsePortRange(item);
        if (!range.ok()) {
            log::warn("service {}: ignoring opaque port entry: {}", service.id.ToString(), range.status().message());
            continue;
        }
        for (unsigned p = range.value().first; p <= range.value().last; ++p) {
            ports.insert(static_cast<std::uint16_t>(p));
        }
    }
    if (ports.empty()) {
        return std::nullopt;
    }
    return ports;
}

TargetPort MapTargetPort(const cluster::ServiceInfo& service, std::uint16_t port) {
    for (const auto& p : service.ports) {
        if (p.port != port) {
            continue;
        }
        if (!p.target_port_name.empty()) {
            return TargetPort{0, p.target_port_name};
        }
        return TargetPort{p.target_port != 0 ? p.target_port : port, {}};
    }
    return TargetPort{port, {}};
}

std::optional<std::string> EndpointIdentity(const cluster::BackendRecord& record, std::string_view ns,
                                            std::string_view trust_domain) {
    if (!record.identity.empty()) {
        return record.identity;
    }
    auto sa = record.labels.find("serviceaccount");
    if (sa == record.labels.end() || sa->second.empty() || trust_domain.empty()) {
        return std::nullopt;
    }
    return sa->second + "." + std::string(ns) + ".serviceaccount.identity.linkerd." + std::string(trust_domain);
}

destination::EndpointSet TranslateService(const destination::Destination& dst, std::uint64_t version,
                                          const cluster::ServiceId& id, const cluster::ServiceState& state,
                                          const ResolverOptions& options, std::string_view trust_domain) {
    if (!Exists(state)) {
        return destination::EndpointSet::Missing(dst, version);
    }

    const auto target = MapTargetPort(*state.service, dst.port);
    const OpaquePolicy opaque(*state.service, dst.port, options);
    std::vector<destination::Endpoint> endpoints;
    for (const auto& record : state.backends) {
        if (record.ready && ServesTarget(record, target)) {
            endpoints.push_back(ToEndpoint(record, record.port, id, opaque, trust_domain));
        }
    }
    return destination::EndpointSet(dst, version, true, std::move(endpoints), SetLabels(id));
}

destination::EndpointSet TranslatePod(const destination::Destination& dst, std::uint64_t version,
                                      const cluster::ServiceId& id, std::string_view hostname,
                                      const cluster::ServiceState& state, const ResolverOptions& options,
                                      std::string_view trust_domain) {
    if (!Exists(state)) {
        return destination::EndpointSet::Missing(dst, version);
    }

    const auto target = MapTargetPort(*state.service, dst.port);
    const cluster::BackendRecord* pick = nullptr;
    for (const auto& record : state.backends) {
        if (record.hostname != hostname) {
            continue;
        }
        if (ServesTarget(record, target)) {
            pick = &record;
            break;
        }
        if (pick == nullptr) {
            pick = &record;
        }
    }

    std::vector<destination::Endpoint> endpoints;
    if (pick != nullptr) {
        std::uint16_t port = ServesTarget(*pick, target) ? pick->port : target.number;
        if (port == 0) {
            port = dst.port;
        }
        endpoints.push_back(ToEndpoint(*pick, port, id, OpaquePolicy(*state.service, dst.port, options),
                                       trust_domain));
    }
    return destination::EndpointSet(dst, version, true, std::move(endpoints), SetLabels(id));
}

} // namespace meshdest::resolvers

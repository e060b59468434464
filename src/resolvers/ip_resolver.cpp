#include <meshdest/resolvers/ip_resolver.h>

namespace meshdest::resolvers {

IpResolver::IpResolver(ResolverOptions options) : options_(std::move(options)) {}

bool IpResolver::CanResolve(const destination::Destination& dst) const {
    return destination::IpAddress::Parse(dst.path).ok();
}

Status IpResolver::StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                                    const destination::DoneSignal& done) {
    auto ip = destination::IpAddress::Parse(dst.path);
    if (!ip.ok()) {
        return ip.status();
    }

    destination::Endpoint ep;
    ep.address = destination::TcpAddress{ip.value(), dst.port};
    ep.opaque_protocol = options_.opaque_ports.count(dst.port) != 0;
    emit(destination::EndpointSet(dst, 1, true, {ep}));

    // The mapping never changes.
    done.Wait();
    return Status::Ok();
}

} // namespace meshdest::resolvers

#include <meshdest/destination/endpoint_set.h>

namespace meshdest::destination {

EndpointSet::EndpointSet(Destination destination, std::uint64_t version, bool exists,
                         std::vector<Endpoint> endpoints, Labels labels)
    : destination_(std::move(destination)), version_(version), exists_(exists), labels_(std::move(labels)) {
    if (!exists_) {
        return;
    }
    for (auto& ep : endpoints) {
        auto key = ep.address;
        endpoints_.emplace(key, std::move(ep));
    }
}

EndpointSet EndpointSet::Missing(Destination destination, std::uint64_t version) {
    return EndpointSet(std::move(destination), version, false, {});
}

} // namespace meshdest::destination

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <meshdest/destination/address.h>
#include <meshdest/destination/destination.h>

namespace meshdest::destination {

using Labels = std::map<std::string, std::string>;

// One concrete backend. Two endpoints are the same endpoint iff their
// addresses are equal; everything else is payload.
struct Endpoint {
    TcpAddress address;
    std::optional<std::string> identity;
    Labels metric_labels;
    std::optional<std::uint32_t> weight;
    bool opaque_protocol = false;
    std::string hostname;

    bool operator==(const Endpoint& o) const { return address == o.address; }
};

// Immutable snapshot of the endpoints known for one destination.
// Invariant: !exists implies endpoints.empty().
class EndpointSet {
public:
    using Map = std::map<TcpAddress, Endpoint>;

    EndpointSet() = default;

    // Duplicate addresses keep their first occurrence. When `exists` is
    // false the endpoint list is discarded.
    EndpointSet(Destination destination, std::uint64_t version, bool exists,
                std::vector<Endpoint> endpoints, Labels labels = {});

    static EndpointSet Missing(Destination destination, std::uint64_t version);

    const Destination& destination() const { return destination_; }
    std::uint64_t version() const { return version_; }
    bool exists() const { return exists_; }
    const Map& endpoints() const { return endpoints_; }
    const Labels& labels() const { return labels_; }

    bool empty() const { return endpoints_.empty(); }
    std::size_t size() const { return endpoints_.size(); }
    bool Contains(const TcpAddress& addr) const { return endpoints_.count(addr) != 0; }

private:
    Destination destination_;
    std::uint64_t version_ = 0;
    bool exists_ = false;
    Map endpoints_;
    Labels labels_;
};

// Change between two snapshots. `no_endpoints`, when present, holds the
// `exists` flag of the newer snapshot.
struct Delta {
    std::vector<Endpoint> added;
    std::vector<Endpoint> removed;
    std::optional<bool> no_endpoints;
    Labels labels; // set-level labels of the newer snapshot, sent with adds

    bool empty() const { return added.empty() && removed.empty() && !no_endpoints.has_value(); }
};

} // namespace meshdest::destination

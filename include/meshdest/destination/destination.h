#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <meshdest/core/status.h>

namespace meshdest::destination {

enum class Scheme {
    ip,
    k8s,
    mirror,
};

std::string_view SchemeName(Scheme scheme);
Result<Scheme> ParseScheme(std::string_view name);

// Logical name + port a client wants to reach. Identity key of a Watch.
struct Destination {
    Scheme scheme = Scheme::k8s;
    std::string path; // host only, no port
    std::uint16_t port = 0;

    // "k8s://web.default.svc.cluster.local:8080"
    std::string ToString() const;

    bool operator==(const Destination&) const = default;
};

struct DestinationHash {
    std::size_t operator()(const Destination& d) const;
};

inline constexpr std::uint16_t kDefaultPort = 80;

// Builds a Destination from a scheme name and a "host[:port]" authority.
// IPv6 literals must be bracketed when a port is given. The port defaults to
// 80.
Result<Destination> ParseDestination(std::string_view scheme, std::string_view authority);

} // namespace meshdest::destination

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <meshdest/core/status.h>
#include <meshdest/resilience/retry.h>

namespace meshdest::resolvers {

// Ports whose traffic is proxied opaquely unless configured otherwise.
std::set<std::uint16_t> DefaultOpaquePorts();

// Inclusive; a single port has first == last.
struct PortRange {
    std::uint16_t first = 0;
    std::uint16_t last = 0;
};

// Items of a comma-separated list with surrounding spaces trimmed. Empty
// items are dropped.
std::vector<std::string_view> SplitPortList(std::string_view text);

// "8080" or "4000-4100".
Result<PortRange> ParsePortRange(std::string_view item);

// Every port named by a comma-separated list of ports and ranges.
Result<std::set<std::uint16_t>> ParsePortList(std::string_view text);

// Immutable settings shared by the cluster-backed resolvers.
struct ResolverOptions {
    std::string cluster_domain = "cluster.local";
    std::string trust_domain = "cluster.local";
    std::set<std::uint16_t> opaque_ports = DefaultOpaquePorts();
    resilience::RetryOptions retry;
};

} // namespace meshdest::resolvers

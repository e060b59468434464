#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/core/status.h>

namespace meshdest::cluster {

// Splits a DNS name into its labels, dropping one trailing dot. Every label
// must be 1-63 characters of [A-Za-z0-9_-], must not start or end with '-',
// and must contain at least one letter (which rules out IP literals).
Result<std::vector<std::string>> SplitDnsName(std::string_view name);

// Returns `labels` without `suffix` if it ends with it (case-insensitive).
std::optional<std::vector<std::string>> MaybeStripSuffixLabels(const std::vector<std::string>& labels,
                                                              const std::vector<std::string>& suffix);

// A cluster-local service name. `hostname` is set for the pod-direct form.
struct ServiceName {
    ServiceId id;
    std::string hostname;
};

// Parses "<svc>.<ns>.svc[.<zone>]" or "<hostname>.<svc>.<ns>.svc[.<zone>]".
// The zone is `cluster_domain` or "cluster.local"; both may be omitted.
Result<ServiceName> ParseServiceName(std::string_view host, std::string_view cluster_domain);

} // namespace meshdest::cluster

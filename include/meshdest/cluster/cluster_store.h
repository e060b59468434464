#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/core/status.h>

namespace meshdest::cluster {

// A linked remote cluster: its own state view plus immutable config.
struct RemoteCluster {
    std::shared_ptr<IClusterState> state;
    std::string trust_domain = "cluster.local";
    std::string cluster_domain = "cluster.local";
};

// Index of remote clusters, keyed by the link name carried on mirrored
// services.
class ClusterStore {
public:
    // Thread-safe. Replaces an existing entry of the same name.
    void Add(std::string name, RemoteCluster cluster);
    void Remove(std::string_view name);

    // not_found if no cluster of that name is linked.
    Result<RemoteCluster> Get(std::string_view name) const;

    std::vector<std::string> Names() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, RemoteCluster, std::less<>> clusters_;
};

} // namespace meshdest::cluster

#include <meshdest/cluster/cluster_store.h>

namespace meshdest::cluster {

void ClusterStore::Add(std::string name, RemoteCluster cluster) {
    std::lock_guard<std::mutex> lk(mu_);
    clusters_[std::move(name)] = std::move(cluster);
}

void ClusterStore::Remove(std::string_view name) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = clusters_.find(name);
    if (it != clusters_.end()) {
        clusters_.erase(it);
    }
}

Result<RemoteCluster> ClusterStore::Get(std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = clusters_.find(name);
    if (it == clusters_.end() || !it->second.state) {
        return Status(StatusCode::not_found, "remote cluster " + std::string(name) + " not found");
    }
    return it->second;
}

std::vector<std::string> ClusterStore::Names() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(clusters_.size());
    for (const auto& [name, _] : clusters_) {
        out.push_back(name);
    }
    return out;
}

} // namespace meshdest::cluster

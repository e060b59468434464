#include <meshdest/cluster/cluster_state.h>

namespace meshdest::cluster {

ServiceState InMemoryClusterState::StateLocked(const ServiceId& id) const {
    ServiceState state;
    auto it = services_.find(id);
    if (it != services_.end()) {
        state.service = it->second.service;
        state.backends = it->second.backends;
    }
    return state;
}

void InMemoryClusterState::NotifyLocked(const ServiceId& id) {
    std::optional<ServiceState> state;
    for (auto& [_, w] : watchers_) {
        if (w.failed || w.id != id || !w.callbacks.on_state) {
            continue;
        }
        if (!state) {
            state = StateLocked(id);
        }
        w.callbacks.on_state(*state);
    }
}

void InMemoryClusterState::SetService(ServiceInfo info) {
    std::lock_guard<std::mutex> lk(mu_);
    const ServiceId id = info.id;
    services_[id].service = std::move(info);
    NotifyLocked(id);
}

void InMemoryClusterState::DeleteService(const ServiceId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = services_.find(id);
    if (it == services_.end()) {
        return;
    }
    // Backends outlive their service object, as endpoint objects do.
    it->second.service.reset();
    NotifyLocked(id);
}

void InMemoryClusterState::SetBackends(const ServiceId& id, std::vector<BackendRecord> backends) {
    std::lock_guard<std::mutex> lk(mu_);
    services_[id].backends = std::move(backends);
    NotifyLocked(id);
}

void InMemoryClusterState::DisconnectWatches(Status reason) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& [_, w] : watchers_) {
        if (w.failed) {
            continue;
        }
        w.failed = true;
        if (w.callbacks.on_error) {
            w.callbacks.on_error(reason);
        }
    }
}

std::size_t InMemoryClusterState::watch_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (const auto& [_, w] : watchers_) {
        if (!w.failed) {
            ++n;
        }
    }
    return n;
}

std::optional<ServiceInfo> InMemoryClusterState::GetService(const ServiceId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = services_.find(id);
    if (it == services_.end()) {
        return std::nullopt;
    }
    return it->second.service;
}

WatchToken InMemoryClusterState::Watch(const ServiceId& id, ServiceWatchCallbacks callbacks) {
    std::lock_guard<std::mutex> lk(mu_);
    const WatchToken token = next_token_++;
    auto& w = watchers_[token];
    w.id = id;
    w.callbacks = std::move(callbacks);
    if (w.callbacks.on_state) {
        w.callbacks.on_state(StateLocked(id));
    }
    return token;
}

void InMemoryClusterState::Unwatch(WatchToken token) {
    std::lock_guard<std::mutex> lk(mu_);
    watchers_.erase(token);
}

} // namespace meshdest::cluster

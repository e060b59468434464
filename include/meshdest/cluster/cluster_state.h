#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <meshdest/core/status.h>
#include <meshdest/destination/address.h>

namespace meshdest::cluster {

struct ServiceId {
    std::string ns;
    std::string name;

    // "ns/name"
    std::string ToString() const { return ns + "/" + name; }

    auto operator<=>(const ServiceId&) const = default;
};

// One entry of a service's port table.
struct PortMapping {
    std::uint16_t port = 0;
    std::uint16_t target_port = 0; // 0: same as port, or named
    std::string target_port_name;
    std::string name; // the service port's own name, may be empty
};

struct ServiceInfo {
    ServiceId id;
    bool external_name = false;
    std::vector<PortMapping> ports;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
};

// A backing workload address as the cluster reports it.
struct BackendRecord {
    destination::IpAddress address;
    std::uint16_t port = 0;
    std::string port_name;
    std::string hostname; // set for pods behind headless services
    std::string pod;
    std::string identity;
    std::map<std::string, std::string> labels;
    bool ready = true;
};

// Full state of one service. `service` is empty when it does not exist.
struct ServiceState {
    std::optional<ServiceInfo> service;
    std::vector<BackendRecord> backends;
};

struct ServiceWatchCallbacks {
    std::function<void(const ServiceState&)> on_state;
    // The watch is dead after this; the token still has to be released.
    std::function<void(const Status&)> on_error;
};

using WatchToken = std::uint64_t;

// Watch-style view of the cluster. Callbacks run on the collaborator's
// threads and must neither block nor call back into it.
class IClusterState {
public:
    virtual ~IClusterState() = default;

    // Thread-safe
    virtual std::optional<ServiceInfo> GetService(const ServiceId& id) const = 0;

    // Delivers the current state before returning, then every change.
    virtual WatchToken Watch(const ServiceId& id, ServiceWatchCallbacks callbacks) = 0;

    // No callback for `token` runs after this returns.
    virtual void Unwatch(WatchToken token) = 0;
};

// Process-local cluster state. Used by tests and single-process setups.
class InMemoryClusterState final : public IClusterState {
public:
    // Thread-safe
    void SetService(ServiceInfo info);
    void DeleteService(const ServiceId& id);
    void SetBackends(const ServiceId& id, std::vector<BackendRecord> backends);

    // Fails every open watch with `reason`, as an upstream disconnect would.
    void DisconnectWatches(Status reason = Status(StatusCode::unavailable, "cluster state watch disconnected"));

    std::size_t watch_count() const;

    std::optional<ServiceInfo> GetService(const ServiceId& id) const override;
    WatchToken Watch(const ServiceId& id, ServiceWatchCallbacks callbacks) override;
    void Unwatch(WatchToken token) override;

private:
    struct Entry {
        std::optional<ServiceInfo> service;
        std::vector<BackendRecord> backends;
    };

    struct Watcher {
        ServiceId id;
        ServiceWatchCallbacks callbacks;
        bool failed = false;
    };

    ServiceState StateLocked(const ServiceId& id) const;
    void NotifyLocked(const ServiceId& id);

    mutable std::mutex mu_;
    std::map<ServiceId, Entry> services_;
    std::map<WatchToken, Watcher> watchers_;
    WatchToken next_token_ = 1;
};

} // namespace meshdest::cluster

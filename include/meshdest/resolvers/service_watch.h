#pragma once

#include <functional>
#include <string_view>

#include <meshdest/cluster/cluster_state.h>
#include <meshdest/core/status.h>
#include <meshdest/destination/done_signal.h>
#include <meshdest/resilience/retry.h>

namespace meshdest::resolvers {

using ServiceStateFn = std::function<void(const cluster::ServiceState&)>;

// Follows one service until `done` fires, calling `on_state` on the calling
// thread with every state the cluster reports. Bursts are coalesced to the
// latest state. A failed upstream watch is re-opened with backoff; a
// delivered state clears the failure streak.
//
// Returns OK once `done` fired, or unavailable when the retries ran out.
Status FollowService(cluster::IClusterState& state, const cluster::ServiceId& id,
                     const resilience::RetryPolicy& retry, const destination::DoneSignal& done,
                     const ServiceStateFn& on_state);

} // namespace meshdest::resolvers

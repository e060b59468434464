#pragma once

#include <cstdint>
#include <vector>

#include <meshdest/api/destination.pb.h>
#include <meshdest/api/net.pb.h>
#include <meshdest/core/status.h>
#include <meshdest/destination/endpoint_set.h>

namespace meshdest::protohttp {

// Weight sent for endpoints that do not carry one.
inline constexpr std::uint32_t kDefaultWeight = 10000;

api::net::TcpAddress ToProto(const destination::TcpAddress& addr);
Result<destination::TcpAddress> FromProto(const api::net::TcpAddress& addr);

// One Update per non-empty part of `delta`, in the order add, remove,
// no_endpoints.
std::vector<api::destination::Update> DeltaToUpdates(const destination::Delta& delta);

} // namespace meshdest::protohttp

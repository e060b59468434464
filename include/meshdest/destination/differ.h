#pragma once

#include <meshdest/destination/endpoint_set.h>

namespace meshdest::destination {

// Computes the change from `previous` (nullptr when nothing was seen yet) to
// `next`. Endpoints are compared by address only. An empty result means the
// transition must not be published.
//
//  - first snapshot: everything is added; an empty snapshot yields
//    no_endpoints = next.exists() instead.
//  - losing the last endpoint yields the removals together with
//    no_endpoints = next.exists().
//  - an exists flip between two empty snapshots yields no_endpoints alone.
Delta Diff(const EndpointSet* previous, const EndpointSet& next);

} // namespace meshdest::destination

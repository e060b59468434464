#include <meshdest/destination/differ.h>

namespace meshdest::destination {

Delta Diff(const EndpointSet* previous, const EndpointSet& next) {
    Delta delta;

    if (previous == nullptr) {
        if (next.empty()) {
            delta.no_endpoints = next.exists();
            return delta;
        }
        delta.added.reserve(next.size());
        for (const auto& kv : next.endpoints()) {
            delta.added.push_back(kv.second);
        }
        delta.labels = next.labels();
        return delta;
    }

    // Both maps are ordered by address, so a single merge pass computes
    // both differences.
    const auto& prev = previous->endpoints();
    const auto& cur = next.endpoints();
    auto p = prev.begin();
    auto c = cur.begin();
    while (p != prev.end() || c != cur.end()) {
        if (c == cur.end() || (p != prev.end() && p->first < c->first)) {
            delta.removed.push_back(p->second);
            ++p;
        } else if (p == prev.end() || c->first < p->first) {
            delta.added.push_back(c->second);
            ++c;
        } else {
            ++p;
            ++c;
        }
    }

    if (next.empty() && (!previous->empty() || previous->exists() != next.exists())) {
        delta.no_endpoints = next.exists();
    }
    if (!delta.added.empty()) {
        delta.labels = next.labels();
    }
    return delta;
}

} // namespace meshdest::destination

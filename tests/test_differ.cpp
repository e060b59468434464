#include <chtest.hpp>

#include <meshdest/destination/differ.h>

#include "test_support.h"

#include <set>

using meshdest::destination::Delta;
using meshdest::destination::Diff;
using meshdest::destination::EndpointSet;
using meshdest::destination::TcpAddress;
using meshdest::testing::Addr;
using meshdest::testing::Ep;
using meshdest::testing::HasAddr;
using meshdest::testing::Set;

namespace {

std::set<TcpAddress> Apply(const EndpointSet& from, const Delta& delta) {
    std::set<TcpAddress> out;
    for (const auto& [addr, _] : from.endpoints()) {
        out.insert(addr);
    }
    for (const auto& ep : delta.removed) {
        out.erase(ep.address);
    }
    for (const auto& ep : delta.added) {
        out.insert(ep.address);
    }
    return out;
}

std::set<TcpAddress> Addrs(const EndpointSet& s) {
    std::set<TcpAddress> out;
    for (const auto& [addr, _] : s.endpoints()) {
        out.insert(addr);
    }
    return out;
}

} // namespace

TEST_CASE("Diff of first snapshot adds everything") {
    auto next = Set({Ep("10.0.0.1", 80), Ep("10.0.0.2", 80)});
    auto d = Diff(nullptr, next);

    REQUIRE(d.added.size() == 2);
    REQUIRE(d.removed.empty());
    REQUIRE(!d.no_endpoints.has_value());
}

TEST_CASE("Diff of empty first snapshot reports no endpoints") {
    auto exists = Diff(nullptr, Set({}, 1, true));
    REQUIRE(exists.added.empty());
    REQUIRE(exists.no_endpoints.has_value());
    REQUIRE(*exists.no_endpoints == true);

    auto missing = Diff(nullptr, EndpointSet::Missing(meshdest::testing::Dst("x.ns.svc", 80), 1));
    REQUIRE(missing.no_endpoints.has_value());
    REQUIRE(*missing.no_endpoints == false);
}

TEST_CASE("Diff adds and removes exactly the set differences") {
    auto a = Set({Ep("10.0.0.1", 80), Ep("10.0.0.2", 80), Ep("10.0.0.4", 80)});
    auto b = Set({Ep("10.0.0.2", 80), Ep("10.0.0.3", 80), Ep("10.0.0.4", 81)}, 2);

    auto d = Diff(&a, b);

    REQUIRE(d.added.size() == 2);
    REQUIRE(HasAddr(d.added, Addr("10.0.0.3", 80)));
    REQUIRE(HasAddr(d.added, Addr("10.0.0.4", 81)));
    REQUIRE(d.removed.size() == 2);
    REQUIRE(HasAddr(d.removed, Addr("10.0.0.1", 80)));
    REQUIRE(HasAddr(d.removed, Addr("10.0.0.4", 80)));
    REQUIRE(!HasAddr(d.added, Addr("10.0.0.2", 80)));
    REQUIRE(!HasAddr(d.removed, Addr("10.0.0.2", 80)));
    REQUIRE(!d.no_endpoints.has_value());
    REQUIRE(Apply(a, d) == Addrs(b));
}

TEST_CASE("Diff applied to the previous set yields the next set") {
    const std::vector<std::vector<const char*>> steps = {
        {},
        {"10.0.0.1"},
        {"10.0.0.1", "10.0.0.2", "10.0.0.3"},
        {"10.0.0.3"},
        {"10.0.0.4", "10.0.0.5"},
        {"10.0.0.5", "10.0.0.1"},
        {},
    };
    std::vector<EndpointSet> sets;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        std::vector<meshdest::destination::Endpoint> eps;
        for (const auto* ip : steps[i]) {
            eps.push_back(Ep(ip, 8080));
        }
        sets.push_back(Set(std::move(eps), i + 1));
    }
    for (const auto& a : sets) {
        for (const auto& b : sets) {
            REQUIRE(Apply(a, Diff(&a, b)) == Addrs(b));
        }
    }
}

TEST_CASE("Diff of identical snapshots is empty") {
    auto a = Set({Ep("10.0.0.1", 80), Ep("fd00::1", 80)});
    auto b = Set({Ep("fd00::1", 80), Ep("10.0.0.1", 80)}, 7);

    REQUIRE(Diff(&a, a).empty());
    REQUIRE(Diff(&a, b).empty());

    auto empty = Set({});
    REQUIRE(Diff(&empty, empty).empty());
}

TEST_CASE("Diff ignores metadata-only changes") {
    auto plain = Ep("10.0.0.1", 80);
    auto labelled = plain;
    labelled.metric_labels["pod"] = "web-0";
    labelled.identity = "web.default.serviceaccount.identity.linkerd.cluster.local";
    labelled.weight = 5;

    auto a = Set({plain});
    auto b = Set({labelled}, 2);
    REQUIRE(Diff(&a, b).empty());
}

TEST_CASE("Diff losing the last endpoint removes it and reports no endpoints") {
    auto a = Set({Ep("10.0.0.1", 80), Ep("10.0.0.2", 80)});
    auto b = Set({}, 2, true);

    auto d = Diff(&a, b);
    REQUIRE(d.removed.size() == 2);
    REQUIRE(d.added.empty());
    REQUIRE(d.no_endpoints.has_value());
    REQUIRE(*d.no_endpoints == true);
}

TEST_CASE("Diff reports an exists flip between empty snapshots") {
    auto present = Set({}, 1, true);
    auto gone = Set({}, 2, false);

    auto d = Diff(&present, gone);
    REQUIRE(d.added.empty());
    REQUIRE(d.removed.empty());
    REQUIRE(d.no_endpoints.has_value());
    REQUIRE(*d.no_endpoints == false);

    auto back = Diff(&gone, present);
    REQUIRE(back.no_endpoints.has_value());
    REQUIRE(*back.no_endpoints == true);
}

TEST_CASE("EndpointSet keeps the first of duplicate addresses") {
    auto first = Ep("10.0.0.1", 80);
    first.hostname = "first";
    auto second = Ep("10.0.0.1", 80);
    second.hostname = "second";

    auto s = Set({first, second});
    REQUIRE(s.size() == 1);
    REQUIRE(s.endpoints().begin()->second.hostname == "first");
}

TEST_CASE("EndpointSet that does not exist has no endpoints") {
    auto s = Set({Ep("10.0.0.1", 80)}, 1, false);
    REQUIRE(!s.exists());
    REQUIRE(s.empty());
}

TEST_CASE("Diff carries set labels with additions only") {
    auto dst = meshdest::testing::Dst("web.default.svc.cluster.local", 80);
    meshdest::destination::Labels labels{{"namespace", "default"}, {"service", "web"}};
    EndpointSet a(dst, 1, true, {Ep("10.0.0.1", 80)}, labels);
    EndpointSet b(dst, 2, true, {Ep("10.0.0.2", 80)}, labels);
    EndpointSet c(dst, 3, true, {}, labels);

    REQUIRE(Diff(nullptr, a).labels == labels);
    REQUIRE(Diff(&a, b).labels == labels);
    REQUIRE(Diff(&b, c).labels.empty());
}

#include <chtest.hpp>

#include <meshdest/cluster/dns_name.h>
#include <meshdest/destination/address.h>
#include <meshdest/destination/destination.h>

#include <unordered_set>

using meshdest::StatusCode;
using meshdest::cluster::ParseServiceName;
using meshdest::cluster::SplitDnsName;
using meshdest::destination::Destination;
using meshdest::destination::DestinationHash;
using meshdest::destination::IpAddress;
using meshdest::destination::ParseDestination;
using meshdest::destination::Scheme;
using meshdest::destination::TcpAddress;

TEST_CASE("ParseDestination splits host and port") {
    auto d = ParseDestination("k8s", "web.default.svc.cluster.local:8080");
    REQUIRE(d.ok());
    REQUIRE(d.value().scheme == Scheme::k8s);
    REQUIRE(d.value().path == "web.default.svc.cluster.local");
    REQUIRE(d.value().port == 8080);
    REQUIRE(d.value().ToString() == "k8s://web.default.svc.cluster.local:8080");
}

TEST_CASE("ParseDestination defaults the port to 80") {
    auto d = ParseDestination("ip", "10.1.2.3");
    REQUIRE(d.ok());
    REQUIRE(d.value().scheme == Scheme::ip);
    REQUIRE(d.value().port == 80);
}

TEST_CASE("ParseDestination accepts bracketed IPv6 literals") {
    auto with_port = ParseDestination("ip", "[fd00::1]:8443");
    REQUIRE(with_port.ok());
    REQUIRE(with_port.value().path == "fd00::1");
    REQUIRE(with_port.value().port == 8443);
    REQUIRE(with_port.value().ToString() == "ip://[fd00::1]:8443");

    auto no_port = ParseDestination("ip", "[fd00::1]");
    REQUIRE(no_port.ok());
    REQUIRE(no_port.value().port == 80);
}

TEST_CASE("ParseDestination rejects malformed authorities") {
    const char* bad[] = {
        "",
        ":80",
        "web:",
        "web:http",
        "web:0",
        "web:65536",
        "fd00::1:80",
        "[fd00::1",
        "[fd00::1]x",
        "[fd00::1]:",
    };
    for (const auto* authority : bad) {
        auto d = ParseDestination("k8s", authority);
        REQUIRE(!d.ok());
        REQUIRE(d.status().code() == StatusCode::invalid_argument);
    }
}

TEST_CASE("ParseDestination rejects unknown schemes") {
    auto d = ParseDestination("dns", "web:80");
    REQUIRE(d.status().code() == StatusCode::invalid_argument);
}

TEST_CASE("Destinations are equal only in scheme, path and port") {
    Destination a{Scheme::k8s, "web.default.svc.cluster.local", 80};
    Destination b = a;
    Destination c{Scheme::mirror, "web.default.svc.cluster.local", 80};
    Destination d{Scheme::k8s, "web.default.svc.cluster.local", 81};

    REQUIRE(a == b);
    REQUIRE(!(a == c));
    REQUIRE(!(a == d));

    std::unordered_set<Destination, DestinationHash> set{a, b, c, d};
    REQUIRE(set.size() == 3);
}

TEST_CASE("IpAddress parses both families") {
    auto v4 = IpAddress::Parse("192.168.0.1");
    REQUIRE(v4.ok());
    REQUIRE(v4.value().is_v4());
    REQUIRE(v4.value().ToV4Uint() == 0xc0a80001u);
    REQUIRE(v4.value().ToString() == "192.168.0.1");

    auto v6 = IpAddress::Parse("fd00::1");
    REQUIRE(v6.ok());
    REQUIRE(!v6.value().is_v4());
    REQUIRE(v6.value().ToString() == "fd00::1");
    REQUIRE(TcpAddress{v6.value(), 80}.ToString() == "[fd00::1]:80");

    REQUIRE(!IpAddress::Parse("web").ok());
    REQUIRE(!IpAddress::Parse("10.0.0.256").ok());
    REQUIRE(!IpAddress::Parse("").ok());
}

TEST_CASE("SplitDnsName validates labels") {
    auto ok = SplitDnsName("web.default.svc.cluster.local.");
    REQUIRE(ok.ok());
    REQUIRE(ok.value().size() == 5);
    REQUIRE(ok.value()[0] == "web");

    REQUIRE(!SplitDnsName("").ok());
    REQUIRE(!SplitDnsName("web..default").ok());
    REQUIRE(!SplitDnsName("-web.default").ok());
    REQUIRE(!SplitDnsName("web-.default").ok());
    REQUIRE(!SplitDnsName("10.0.0.1").ok());
    REQUIRE(!SplitDnsName("not a valid authority").ok());
    REQUIRE(!SplitDnsName(std::string(64, 'a') + ".svc").ok());
    REQUIRE(SplitDnsName(std::string(63, 'a') + ".svc").ok());
}

TEST_CASE("ParseServiceName recognises service names") {
    auto full = ParseServiceName("web.default.svc.cluster.local", "cluster.local");
    REQUIRE(full.ok());
    REQUIRE(full.value().id.ns == "default");
    REQUIRE(full.value().id.name == "web");
    REQUIRE(full.value().hostname.empty());

    auto short_form = ParseServiceName("web.default.svc", "cluster.local");
    REQUIRE(short_form.ok());
    REQUIRE(short_form.value().id.name == "web");

    auto mixed_case = ParseServiceName("web.default.SVC.Cluster.Local", "cluster.local");
    REQUIRE(mixed_case.ok());

    auto custom = ParseServiceName("web.prod.svc.mesh.example", "mesh.example");
    REQUIRE(custom.ok());
    REQUIRE(custom.value().id.ns == "prod");
}

TEST_CASE("ParseServiceName recognises pod names") {
    auto pod = ParseServiceName("db-0.db.data.svc.cluster.local", "cluster.local");
    REQUIRE(pod.ok());
    REQUIRE(pod.value().hostname == "db-0");
    REQUIRE(pod.value().id.name == "db");
    REQUIRE(pod.value().id.ns == "data");
}

TEST_CASE("ParseServiceName rejects other names") {
    REQUIRE(!ParseServiceName("web.default.cluster.local", "cluster.local").ok());
    REQUIRE(!ParseServiceName("default.svc.cluster.local", "cluster.local").ok());
    REQUIRE(!ParseServiceName("a.b.c.d.svc.cluster.local", "cluster.local").ok());
    REQUIRE(!ParseServiceName("example.com", "cluster.local").ok());
    REQUIRE(!ParseServiceName("web.default.svc.other.zone", "cluster.local").ok());
}

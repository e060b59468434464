#include <chtest.hpp>

#include <meshdest/client/destination_client.h>
#include <meshdest/cluster/cluster_state.h>
#include <meshdest/cluster/cluster_store.h>
#include <meshdest/destination/registry.h>
#include <meshdest/http/http_client.h>
#include <meshdest/http/http_server.h>
#include <meshdest/protohttp/update_codec.h>
#include <meshdest/resolvers/resolvers.h>
#include <meshdest/runtime/io_context_pool.h>
#include <meshdest/server/destination_server.h>

#include "test_support.h"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using meshdest::StatusCode;
using meshdest::api::destination::Update;
using meshdest::client::DestinationClient;
using meshdest::cluster::BackendRecord;
using meshdest::cluster::InMemoryClusterState;
using meshdest::cluster::PortMapping;
using meshdest::cluster::ServiceId;
using meshdest::cluster::ServiceInfo;
using meshdest::testing::Eventually;

namespace {

constexpr auto kTimeout = std::chrono::seconds(5);

BackendRecord Backend(std::string_view ip, std::uint16_t port) {
    BackendRecord b;
    b.address = meshdest::destination::IpAddress::Parse(ip).value();
    b.port = port;
    return b;
}

std::set<std::string> Addrs(const Update& u) {
    std::set<std::string> out;
    if (u.has_add()) {
        for (const auto& a : u.add().addrs()) {
            out.insert(meshdest::protohttp::FromProto(a.addr()).value().ToString());
        }
    } else if (u.has_remove()) {
        for (const auto& a : u.remove().addrs()) {
            out.insert(meshdest::protohttp::FromProto(a).value().ToString());
        }
    }
    return out;
}

// A destination server on an ephemeral port, fed by an in-memory cluster.
struct ServerFixture {
    explicit ServerFixture(meshdest::resolvers::ResolverOptions options = {}) : pool(2) {
        pool.Start();
        registry = std::make_unique<meshdest::destination::Registry>(
            pool.Next(), meshdest::resolvers::DefaultResolvers(state, clusters, options));
        server = std::make_shared<meshdest::server::DestinationServer>(
            pool.Next(), meshdest::http::ListenAddress{"127.0.0.1", 0}, *registry);
        server->Start();
    }

    ~ServerFixture() {
        server->Stop();
        server.reset();
        registry.reset();
        pool.Stop();
    }

    std::string port() const { return std::to_string(server->BoundPort()); }

    void PublishWeb(std::vector<BackendRecord> backends) {
        ServiceInfo info;
        info.id = ServiceId{"default", "web"};
        info.ports.push_back(PortMapping{80, 8080, ""});
        state->SetService(info);
        state->SetBackends(info.id, std::move(backends));
    }

    meshdest::IoContextPool pool;
    std::shared_ptr<InMemoryClusterState> state = std::make_shared<InMemoryClusterState>();
    std::shared_ptr<meshdest::cluster::ClusterStore> clusters = std::make_shared<meshdest::cluster::ClusterStore>();
    std::unique_ptr<meshdest::destination::Registry> registry;
    std::shared_ptr<meshdest::server::DestinationServer> server;
};

} // namespace

TEST_CASE("Server streams endpoint updates to a client") {
    ServerFixture f;
    f.PublishWeb({Backend("10.0.0.1", 8080), Backend("10.0.0.2", 8080)});
    REQUIRE(f.server->BoundPort() != 0);

    DestinationClient client("127.0.0.1", f.port(), kTimeout);
    REQUIRE(client.Open("k8s", "web.default.svc.cluster.local:80").ok());

    auto first = client.Recv();
    REQUIRE(first.ok());
    REQUIRE(first.value().has_add());
    REQUIRE(Addrs(first.value()) == std::set<std::string>{"10.0.0.1:8080", "10.0.0.2:8080"});
    REQUIRE(first.value().add().metric_labels().at("namespace") == "default");
    REQUIRE(first.value().add().addrs(0).weight() == meshdest::protohttp::kDefaultWeight);

    f.PublishWeb({Backend("10.0.0.2", 8080), Backend("10.0.0.3", 8080)});
    auto add = client.Recv();
    REQUIRE(add.ok());
    REQUIRE(add.value().has_add());
    REQUIRE(Addrs(add.value()) == std::set<std::string>{"10.0.0.3:8080"});
    auto remove = client.Recv();
    REQUIRE(remove.ok());
    REQUIRE(remove.value().has_remove());
    REQUIRE(Addrs(remove.value()) == std::set<std::string>{"10.0.0.1:8080"});

    f.PublishWeb({});
    auto gone = client.Recv();
    REQUIRE(gone.ok());
    REQUIRE(gone.value().has_remove());
    auto empty = client.Recv();
    REQUIRE(empty.ok());
    REQUIRE(empty.value().has_no_endpoints());
    REQUIRE(empty.value().no_endpoints().exists());
}

TEST_CASE("Server resolves literal IPs") {
    ServerFixture f;
    DestinationClient client("127.0.0.1", f.port(), kTimeout);
    REQUIRE(client.Open("ip", "[fd00::5]:6379").ok());

    auto u = client.Recv();
    REQUIRE(u.ok());
    REQUIRE(Addrs(u.value()) == std::set<std::string>{"[fd00::5]:6379"});
    REQUIRE(u.value().add().addrs(0).opaque_protocol());
}

TEST_CASE("Server reports unknown services as not existing") {
    ServerFixture f;
    DestinationClient client("127.0.0.1", f.port(), kTimeout);
    REQUIRE(client.Open("k8s", "nope.default.svc.cluster.local").ok());

    auto u = client.Recv();
    REQUIRE(u.ok());
    REQUIRE(u.value().has_no_endpoints());
    REQUIRE(!u.value().no_endpoints().exists());
}

TEST_CASE("Server rejects unresolvable destinations with an error response") {
    ServerFixture f;
    DestinationClient client("127.0.0.1", f.port(), kTimeout);

    auto st = client.Open("k8s", "not a valid authority");
    REQUIRE(st.code() == StatusCode::invalid_argument);
    REQUIRE(st.message().find("cannot resolve destination") != std::string::npos);
    REQUIRE(Eventually([&] { return f.server->active_streams() == 0; }));
}

TEST_CASE("Server rejects malformed requests") {
    ServerFixture f;

    DestinationClient bad_scheme("127.0.0.1", f.port(), kTimeout);
    REQUIRE(bad_scheme.Open("ftp", "web.default.svc.cluster.local").code() == StatusCode::invalid_argument);

    DestinationClient bad_port("127.0.0.1", f.port(), kTimeout);
    REQUIRE(bad_port.Open("k8s", "web.default.svc.cluster.local:http").code() == StatusCode::invalid_argument);

    auto garbage = meshdest::http::HttpClient::Post("127.0.0.1", f.port(), "/api/v1/Get", "application/octet-stream",
                                                   "\xff\xff\xff", kTimeout);
    REQUIRE(garbage.ok());
    REQUIRE(garbage.value().status == 400);
    REQUIRE(garbage.value().headers.count("linkerd-error") == 1);
}

TEST_CASE("Clients of one destination share a watch") {
    ServerFixture f;
    f.PublishWeb({Backend("10.0.0.1", 8080)});

    DestinationClient a("127.0.0.1", f.port(), kTimeout);
    DestinationClient b("127.0.0.1", f.port(), kTimeout);
    REQUIRE(a.Open("k8s", "web.default.svc.cluster.local:80").ok());
    REQUIRE(b.Open("k8s", "web.default.svc.cluster.local:80").ok());
    REQUIRE(a.Recv().ok());
    REQUIRE(b.Recv().ok());

    REQUIRE(f.server->active_streams() == 2);
    REQUIRE(f.registry->WatchCount() == 1);
}

TEST_CASE("Client hanging up cancels its subscription") {
    ServerFixture f;
    f.PublishWeb({Backend("10.0.0.1", 8080)});

    DestinationClient client("127.0.0.1", f.port(), kTimeout);
    REQUIRE(client.Open("k8s", "web.default.svc.cluster.local:80").ok());
    REQUIRE(client.Recv().ok());
    REQUIRE(f.server->active_streams() == 1);

    client.Close();
    REQUIRE(Eventually([&] { return f.server->active_streams() == 0; }));
    REQUIRE(Eventually([&] { return f.registry->WatchCount() == 0; }));
    REQUIRE(Eventually([&] { return f.state->watch_count() == 0; }));
}

TEST_CASE("Server shutdown ends streams cleanly") {
    ServerFixture f;
    f.PublishWeb({Backend("10.0.0.1", 8080)});

    DestinationClient client("127.0.0.1", f.port(), kTimeout);
    REQUIRE(client.Open("k8s", "web.default.svc.cluster.local:80").ok());
    REQUIRE(client.Recv().ok());

    f.server->Stop();
    auto end = client.Recv();
    REQUIRE(!end.ok());
    REQUIRE(end.status().code() == StatusCode::out_of_range);
}

TEST_CASE("Server stop waits for pending error replies") {
    ServerFixture f;
    constexpr int kClients = 8;
    const auto port = f.port();

    std::atomic<bool> go{false};
    std::atomic<int> unexpected{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto resp = meshdest::http::HttpClient::Post("127.0.0.1", port, "/api/v1/Get",
                                                         "application/octet-stream",
                                                         i % 2 == 0 ? std::string("\xff\xff\xff") : std::string(),
                                                         kTimeout);
            if (resp.ok() && resp.value().headers.count("linkerd-error") != 1) {
                unexpected.fetch_add(1);
            }
        });
    }

    go = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    f.server->Stop();
    // Every error reply either finished or was never started.
    REQUIRE(f.server->active_streams() == 0);

    for (auto& t : clients) {
        t.join();
    }
    REQUIRE(unexpected.load() == 0);
    REQUIRE(f.server->active_streams() == 0);
}

TEST_CASE("Error replies are counted until they are written") {
    ServerFixture f;
    auto garbage = meshdest::http::HttpClient::Post("127.0.0.1", f.port(), "/api/v1/Get", "application/octet-stream",
                                                   "\xff\xff\xff", kTimeout);
    REQUIRE(garbage.ok());
    REQUIRE(garbage.value().status == 400);
    REQUIRE(Eventually([&] { return f.server->active_streams() == 0; }));
    REQUIRE(f.registry->WatchCount() == 0);
}

TEST_CASE("Resolution failure mid-stream breaks the connection") {
    meshdest::resolvers::ResolverOptions options;
    options.retry.max_attempts = 1;
    ServerFixture f(options);
    f.PublishWeb({Backend("10.0.0.1", 8080)});

    DestinationClient client("127.0.0.1", f.port(), kTimeout);
    REQUIRE(client.Open("k8s", "web.default.svc.cluster.local:80").ok());
    REQUIRE(client.Recv().ok());

    f.state->DisconnectWatches();
    auto broken = client.Recv();
    REQUIRE(!broken.ok());
    REQUIRE(broken.status().code() != StatusCode::out_of_range);
}

TEST_CASE("Server exposes readiness and metrics") {
    ServerFixture f;
    f.PublishWeb({Backend("10.0.0.1", 8080)});

    DestinationClient client("127.0.0.1", f.port(), kTimeout);
    REQUIRE(client.Open("k8s", "web.default.svc.cluster.local:80").ok());
    REQUIRE(client.Recv().ok());

    auto ready = meshdest::http::HttpClient::Get("127.0.0.1", f.port(), "/ready", kTimeout);
    REQUIRE(ready.ok());
    REQUIRE(ready.value().status == 200);

    auto metrics = meshdest::http::HttpClient::Get("127.0.0.1", f.port(), "/metrics", kTimeout);
    REQUIRE(metrics.ok());
    REQUIRE(metrics.value().status == 200);
    const auto& body = metrics.value().body;
    REQUIRE(body.find("destination_subscribers{destination=\"k8s://web.default.svc.cluster.local:80\"}") !=
            std::string::npos);
    REQUIRE(body.find("destination_exists{destination=\"k8s://web.default.svc.cluster.local:80\"} 1") !=
            std::string::npos);
    REQUIRE(body.find("destination_streams") != std::string::npos);
}

TEST_CASE("Listen reports bad addresses and taken ports") {
    ServerFixture f;
    boost::asio::io_context ioc;

    auto bad_host = std::make_shared<meshdest::http::HttpServer>(
        ioc, meshdest::http::ListenAddress{"not-an-ip", 0}, meshdest::http::Router{});
    REQUIRE(bad_host->Listen().code() == StatusCode::invalid_argument);
    REQUIRE(bad_host->BoundPort() == 0);

    auto taken = std::make_shared<meshdest::http::HttpServer>(
        ioc, meshdest::http::ListenAddress{"127.0.0.1", f.server->BoundPort()}, meshdest::http::Router{});
    auto st = taken->Listen();
    REQUIRE(st.code() == StatusCode::unavailable);
    REQUIRE(st.message().find("cannot bind") != std::string::npos);
}

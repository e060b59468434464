#include <meshdest/cluster/cluster_state.h>
#include <meshdest/cluster/cluster_store.h>
#include <meshdest/config/config.h>
#include <meshdest/config/server_options.h>
#include <meshdest/core/log.h>
#include <meshdest/destination/destination.h>
#include <meshdest/destination/registry.h>
#include <meshdest/resolvers/resolvers.h>
#include <meshdest/runtime/app.h>
#include <meshdest/server/destination_server.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Options {
    std::string config_path;
    // --backend <ns>/<svc>=<ip>:<port>, repeatable.
    std::vector<std::string> backends;
};

void PrintUsage() {
    std::cout << "meshdest_destination options:\n"
              << "  --config <file.json>\n"
              << "  --backend <ns>/<svc>=<ip>:<port>   seed the in-memory cluster state\n";
}

// Groups the --backend flags by service and publishes them, one port mapping
// per distinct backend port.
bool SeedClusterState(const std::vector<std::string>& flags, meshdest::cluster::InMemoryClusterState& state) {
    std::map<meshdest::cluster::ServiceId, std::vector<meshdest::cluster::BackendRecord>> services;
    for (const auto& flag : flags) {
        std::string_view sv(flag);
        auto eq = sv.find('=');
        auto slash = sv.find('/');
        if (eq == std::string_view::npos || slash == std::string_view::npos || slash > eq) {
            std::cerr << "Invalid --backend " << flag << ", expected <ns>/<svc>=<ip>:<port>\n";
            return false;
        }
        meshdest::cluster::ServiceId id{std::string(sv.substr(0, slash)), std::string(sv.substr(slash + 1, eq - slash - 1))};

        auto addr = meshdest::destination::ParseDestination("ip", sv.substr(eq + 1));
        if (!addr.ok()) {
            std::cerr << "Invalid --backend " << flag << ": " << addr.status().message() << "\n";
            return false;
        }
        auto ip = meshdest::destination::IpAddress::Parse(addr.value().path);
        if (!ip.ok()) {
            std::cerr << "Invalid --backend " << flag << ": " << ip.status().message() << "\n";
            return false;
        }

        meshdest::cluster::BackendRecord rec;
        rec.address = ip.value();
        rec.port = addr.value().port;
        services[id].push_back(std::move(rec));
    }

    for (auto& [id, backends] : services) {
        meshdest::cluster::ServiceInfo info;
        info.id = id;
        for (const auto& b : backends) {
            bool seen = false;
            for (const auto& p : info.ports) {
                seen = seen || p.port == b.port;
            }
            if (!seen) {
                info.ports.push_back(meshdest::cluster::PortMapping{b.port, b.port, ""});
            }
        }
        meshdest::log::info("seeded {} with {} backends", id.ToString(), backends.size());
        state.SetService(std::move(info));
        state.SetBackends(id, std::move(backends));
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options cli;
    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << name << "\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (a == "--config") {
            cli.config_path = need("--config");
        } else if (a == "--backend") {
            cli.backends.emplace_back(need("--backend"));
        } else if (a == "--help" || a == "-h") {
            PrintUsage();
            return 0;
        } else {
            std::cerr << "unknown option " << a << "\n";
            PrintUsage();
            return 2;
        }
    }

    meshdest::config::ServerOptions options;
    if (!cli.config_path.empty()) {
        auto cfg = meshdest::config::Config::LoadFile(cli.config_path);
        if (!cfg.ok()) {
            std::cerr << cfg.status().message() << "\n";
            return 2;
        }
        auto loaded = meshdest::config::LoadServerOptions(cfg.value());
        if (!loaded.ok()) {
            std::cerr << cli.config_path << ": " << loaded.status().message() << "\n";
            return 2;
        }
        options = std::move(loaded).value();
    }

    meshdest::App app(meshdest::AppOptions{options.io_threads, options.log_level});

    auto local = std::make_shared<meshdest::cluster::InMemoryClusterState>();
    auto clusters = std::make_shared<meshdest::cluster::ClusterStore>();
    if (!SeedClusterState(cli.backends, *local)) {
        return 2;
    }

    meshdest::destination::Registry registry(
        app.Io().Next(), meshdest::resolvers::DefaultResolvers(local, clusters, options.resolver), options.watch);

    auto server = std::make_shared<meshdest::server::DestinationServer>(app.Io().Next(), options.listen, registry);
    if (auto st = server->Listen(); !st.ok()) {
        std::cerr << st.message() << "\n";
        return 1;
    }
    app.AddServer(server);

    meshdest::log::info("destination service: http://{}:{} (cluster_domain={}, linger={}ms)", options.listen.host,
                        options.listen.port, options.resolver.cluster_domain, options.watch.linger.count());
    meshdest::log::info("Press Ctrl+C to stop.");
    return app.Run();
}

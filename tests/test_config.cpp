#include <chtest.hpp>

#include <meshdest/config/config.h>
#include <meshdest/config/server_options.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

#include <unistd.h>

using meshdest::StatusCode;
using meshdest::config::Config;
using meshdest::config::LoadServerOptions;

namespace {

// A JSON file removed again when the test ends.
class TempConfig {
public:
    explicit TempConfig(const std::string& text) {
        static std::atomic<int> seq{0};
        path_ = std::filesystem::temp_directory_path() /
                ("meshdest_config_test_" + std::to_string(::getpid()) + "_" + std::to_string(seq++) + ".json");
        std::ofstream(path_) << text;
    }

    ~TempConfig() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

meshdest::Result<meshdest::config::ServerOptions> Load(const std::string& text) {
    TempConfig file(text);
    auto cfg = Config::LoadFile(file.path());
    if (!cfg.ok()) {
        return cfg.status();
    }
    return LoadServerOptions(cfg.value());
}

} // namespace

TEST_CASE("Empty config keeps the defaults") {
    auto opts = Load("{}");
    REQUIRE(opts.ok());
    REQUIRE(opts.value().listen.host == "0.0.0.0");
    REQUIRE(opts.value().listen.port == 8086);
    REQUIRE(opts.value().log_level == "info");
    REQUIRE(opts.value().resolver.cluster_domain == "cluster.local");
    REQUIRE(opts.value().resolver.trust_domain == "cluster.local");
    REQUIRE(opts.value().watch.linger.count() == 10000);
    REQUIRE(opts.value().watch.subscription_buffer == 256);
    REQUIRE(opts.value().resolver.opaque_ports.count(3306) == 1);
    REQUIRE(opts.value().resolver.opaque_ports.count(11211) == 1);
    REQUIRE(opts.value().resolver.opaque_ports.count(80) == 0);
}

TEST_CASE("Config overrides every server key") {
    auto opts = Load(R"({
        "listen": "127.0.0.1:9996",
        "log_level": "debug",
        "io_threads": 3,
        "cluster_domain": "mesh.example",
        "trust_domain": "identity.example",
        "linger_ms": 250,
        "subscription_buffer": 16,
        "retry_max_attempts": 4,
        "retry_base_backoff_ms": 20,
        "retry_max_backoff_ms": 400,
        "opaque_ports": "4444, 9000,9001"
    })");
    REQUIRE(opts.ok());
    const auto& o = opts.value();
    REQUIRE(o.listen.host == "127.0.0.1");
    REQUIRE(o.listen.port == 9996);
    REQUIRE(o.log_level == "debug");
    REQUIRE(o.io_threads == 3);
    REQUIRE(o.resolver.cluster_domain == "mesh.example");
    REQUIRE(o.resolver.trust_domain == "identity.example");
    REQUIRE(o.watch.linger.count() == 250);
    REQUIRE(o.watch.subscription_buffer == 16);
    REQUIRE(o.resolver.retry.max_attempts == 4);
    REQUIRE(o.resolver.retry.base_backoff.count() == 20);
    REQUIRE(o.resolver.retry.max_backoff.count() == 400);
    REQUIRE(o.resolver.opaque_ports.size() == 3);
    REQUIRE(o.resolver.opaque_ports.count(9001) == 1);
    REQUIRE(o.resolver.opaque_ports.count(3306) == 0);
}

TEST_CASE("Opaque port list accepts ranges") {
    auto opts = Load(R"({"opaque_ports": "25, 9000-9002"})");
    REQUIRE(opts.ok());
    REQUIRE(opts.value().resolver.opaque_ports == std::set<std::uint16_t>{25, 9000, 9001, 9002});

    auto reversed = Load(R"({"opaque_ports": "9002-9000"})");
    REQUIRE(reversed.status().code() == StatusCode::invalid_argument);
    REQUIRE(reversed.status().message().find("opaque_ports") != std::string::npos);
}

TEST_CASE("Empty opaque port list disables opaque ports") {
    auto opts = Load(R"({"opaque_ports": ""})");
    REQUIRE(opts.ok());
    REQUIRE(opts.value().resolver.opaque_ports.empty());
}

TEST_CASE("Wrongly typed keys are rejected") {
    auto linger = Load(R"({"linger_ms": "soon"})");
    REQUIRE(linger.status().code() == StatusCode::invalid_argument);
    REQUIRE(linger.status().message().find("linger_ms") != std::string::npos);

    auto listen = Load(R"({"listen": 8086})");
    REQUIRE(listen.status().code() == StatusCode::invalid_argument);

    auto level = Load(R"({"log_level": "loud"})");
    REQUIRE(level.status().code() == StatusCode::invalid_argument);
    REQUIRE(level.status().message().find("log_level: unknown log level") == 0);
}

TEST_CASE("Out of range values are rejected") {
    REQUIRE(Load(R"({"subscription_buffer": 0})").status().code() == StatusCode::invalid_argument);
    REQUIRE(Load(R"({"linger_ms": -1})").status().code() == StatusCode::invalid_argument);
    REQUIRE(Load(R"({"listen": "0.0.0.0:70000"})").status().code() == StatusCode::invalid_argument);
    REQUIRE(Load(R"({"listen": "no-port"})").status().code() == StatusCode::invalid_argument);
    REQUIRE(Load(R"({"opaque_ports": "25,smtp"})").status().code() == StatusCode::invalid_argument);
    REQUIRE(Load(R"({"retry_base_backoff_ms": 500, "retry_max_backoff_ms": 100})").status().code() ==
            StatusCode::invalid_argument);
}

TEST_CASE("Config reports unreadable files") {
    auto missing = Config::LoadFile("/nonexistent/meshdest.json");
    REQUIRE(missing.status().code() == StatusCode::not_found);

    TempConfig broken("{\"listen\": ");
    auto parsed = Config::LoadFile(broken.path());
    REQUIRE(parsed.status().code() == StatusCode::invalid_argument);

    TempConfig array("[1, 2]");
    REQUIRE(Config::LoadFile(array.path()).status().code() == StatusCode::invalid_argument);
}

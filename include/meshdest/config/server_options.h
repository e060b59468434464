#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <meshdest/config/config.h>
#include <meshdest/core/status.h>
#include <meshdest/destination/watch.h>
#include <meshdest/http/http_server.h>
#include <meshdest/resolvers/resolver_options.h>

namespace meshdest::config {

struct ServerOptions {
    http::ListenAddress listen{"0.0.0.0", 8086};
    std::string log_level = "info";
    std::size_t io_threads = 0; // 0: one per core
    resolvers::ResolverOptions resolver;
    destination::WatchOptions watch{std::chrono::milliseconds(10000), 256};
};

// Reads the server keys of `cfg` on top of the defaults:
//
//   listen                 "host:port"
//   log_level              string
//   io_threads             int
//   cluster_domain         string
//   trust_domain           string
//   linger_ms              int
//   subscription_buffer    int
//   retry_max_attempts     int
//   retry_base_backoff_ms  int
//   retry_max_backoff_ms   int
//   opaque_ports           "25,587,3306"
//
// A key of the wrong type or out of range is invalid_argument.
meshdest::Result<ServerOptions> LoadServerOptions(const Config& cfg);

} // namespace meshdest::config

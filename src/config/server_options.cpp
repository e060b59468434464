#include <meshdest/config/server_options.h>

#include <charconv>
#include <string_view>

#include <meshdest/core/log.h>

namespace meshdest::config {

namespace {

meshdest::Status KeyError(std::string_view key, const meshdest::Status& st) {
    return meshdest::Status(meshdest::StatusCode::invalid_argument, st.message()).Annotate(key);
}

// Leaves `out` alone when the key is missing.
meshdest::Status ReadString(const Config& cfg, std::string_view key, std::string& out) {
    if (!cfg.Has(key)) {
        return meshdest::Status::Ok();
    }
    auto v = cfg.GetString(key);
    if (!v.ok()) {
        return KeyError(key, v.status());
    }
    out = std::move(v).value();
    return meshdest::Status::Ok();
}

meshdest::Status ReadInt(const Config& cfg, std::string_view key, int min, int max, int& out) {
    if (!cfg.Has(key)) {
        return meshdest::Status::Ok();
    }
    auto v = cfg.GetInt(key);
    if (!v.ok()) {
        return KeyError(key, v.status());
    }
    if (v.value() < min || v.value() > max) {
        return meshdest::Status(meshdest::StatusCode::invalid_argument,
                                std::string(key) + ": " + std::to_string(v.value()) + " out of range");
    }
    out = v.value();
    return meshdest::Status::Ok();
}

meshdest::Result<std::uint16_t> ParsePort(std::string_view text) {
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || port > 65535) {
        return meshdest::Status(meshdest::StatusCode::invalid_argument, "invalid port: " + std::string(text));
    }
    return static_cast<std::uint16_t>(port);
}

meshdest::Result<http::ListenAddress> ParseListen(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return meshdest::Status(meshdest::StatusCode::invalid_argument, "listen: expected host:port");
    }
    auto host = text.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    auto port = ParsePort(text.substr(colon + 1));
    if (!port.ok()) {
        return KeyError("listen", port.status());
    }
    return http::ListenAddress{std::string(host), port.value()};
}

} // namespace

meshdest::Result<ServerOptions> LoadServerOptions(const Config& cfg) {
    ServerOptions opts;

    std::string listen;
    if (auto st = ReadString(cfg, "listen", listen); !st.ok()) {
        return st;
    }
    if (!listen.empty()) {
        auto addr = ParseListen(listen);
        if (!addr.ok()) {
            return addr.status();
        }
        opts.listen = std::move(addr).value();
    }

    if (auto st = ReadString(cfg, "log_level", opts.log_level); !st.ok()) {
        return st;
    }
    if (auto level = log::ParseLevel(opts.log_level); !level.ok()) {
        return level.status().Annotate("log_level");
    }
    if (auto st = ReadString(cfg, "cluster_domain", opts.resolver.cluster_domain); !st.ok()) {
        return st;
    }
    if (auto st = ReadString(cfg, "trust_domain", opts.resolver.trust_domain); !st.ok()) {
        return st;
    }

    int io_threads = static_cast<int>(opts.io_threads);
    if (auto st = ReadInt(cfg, "io_threads", 0, 1024, io_threads); !st.ok()) {
        return st;
    }
    opts.io_threads = static_cast<std::size_t>(io_threads);

    int linger_ms = static_cast<int>(opts.watch.linger.count());
    if (auto st = ReadInt(cfg, "linger_ms", 0, 24 * 3600 * 1000, linger_ms); !st.ok()) {
        return st;
    }
    opts.watch.linger = std::chrono::milliseconds(linger_ms);

    int buffer = static_cast<int>(opts.watch.subscription_buffer);
    if (auto st = ReadInt(cfg, "subscription_buffer", 1, 1 << 20, buffer); !st.ok()) {
        return st;
    }
    opts.watch.subscription_buffer = static_cast<std::size_t>(buffer);

    auto& retry = opts.resolver.retry;
    if (auto st = ReadInt(cfg, "retry_max_attempts", 1, 1 << 20, retry.max_attempts); !st.ok()) {
        return st;
    }
    int base_ms = static_cast<int>(retry.base_backoff.count());
    if (auto st = ReadInt(cfg, "retry_base_backoff_ms", 0, 3600 * 1000, base_ms); !st.ok()) {
        return st;
    }
    retry.base_backoff = std::chrono::milliseconds(base_ms);
    int max_ms = static_cast<int>(retry.max_backoff.count());
    if (auto st = ReadInt(cfg, "retry_max_backoff_ms", 0, 3600 * 1000, max_ms); !st.ok()) {
        return st;
    }
    retry.max_backoff = std::chrono::milliseconds(max_ms);
    if (retry.max_backoff < retry.base_backoff) {
        return meshdest::Status(meshdest::StatusCode::invalid_argument,
                                "retry_max_backoff_ms must not be below retry_base_backoff_ms");
    }

    std::string opaque;
    if (cfg.Has("opaque_ports")) {
        if (auto st = ReadString(cfg, "opaque_ports", opaque); !st.ok()) {
            return st;
        }
        auto ports = resolvers::ParsePortList(opaque);
        if (!ports.ok()) {
            return KeyError("opaque_ports", ports.status());
        }
        opts.resolver.opaque_ports = std::move(ports).value();
    }

    return opts;
}

} // namespace meshdest::config

#include <meshdest/destination/destination.h>

#include <boost/functional/hash.hpp>

#include <charconv>

namespace meshdest::destination {
namespace {

Result<std::uint16_t> ParsePort(std::string_view s) {
    unsigned value = 0;
    auto* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (s.empty() || ec != std::errc() || ptr != end || value == 0 || value > 65535) {
        return Status(StatusCode::invalid_argument, "invalid port " + std::string(s));
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

std::string_view SchemeName(Scheme scheme) {
    switch (scheme) {
        case Scheme::ip: return "ip";
        case Scheme::k8s: return "k8s";
        case Scheme::mirror: return "mirror";
    }
    return "unknown";
}

Result<Scheme> ParseScheme(std::string_view name) {
    if (name == "ip") return Scheme::ip;
    if (name == "k8s") return Scheme::k8s;
    if (name == "mirror") return Scheme::mirror;
    return Status(StatusCode::invalid_argument, "unsupported scheme " + std::string(name));
}

std::string Destination::ToString() const {
    std::string out(SchemeName(scheme));
    out.append("://");
    if (path.find(':') != std::string::npos) {
        out.append("[").append(path).append("]");
    } else {
        out.append(path);
    }
    out.push_back(':');
    out.append(std::to_string(port));
    return out;
}

std::size_t DestinationHash::operator()(const Destination& d) const {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<unsigned>(d.scheme));
    boost::hash_combine(seed, d.path);
    boost::hash_combine(seed, d.port);
    return seed;
}

Result<Destination> ParseDestination(std::string_view scheme, std::string_view authority) {
    auto parsed_scheme = ParseScheme(scheme);
    if (!parsed_scheme.ok()) {
        return parsed_scheme.status();
    }

    Destination dst;
    dst.scheme = parsed_scheme.value();
    dst.port = kDefaultPort;

    std::string_view host = authority;
    std::string_view port;

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return Status(StatusCode::invalid_argument, "invalid destination " + std::string(authority));
        }
        host = authority.substr(1, close - 1);
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return Status(StatusCode::invalid_argument, "invalid destination " + std::string(authority));
            }
            port = rest.substr(1);
            if (port.empty()) {
                return Status(StatusCode::invalid_argument, "invalid destination " + std::string(authority));
            }
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            if (authority.find(':', colon + 1) != std::string_view::npos) {
                return Status(StatusCode::invalid_argument, "invalid destination " + std::string(authority));
            }
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
            if (port.empty()) {
                return Status(StatusCode::invalid_argument, "invalid destination " + std::string(authority));
            }
        }
    }

    if (host.empty()) {
        return Status(StatusCode::invalid_argument, "invalid destination " + std::string(authority));
    }

    if (!port.empty()) {
        auto p = ParsePort(port);
        if (!p.ok()) {
            return p.status();
        }
        dst.port = p.value();
    }

    dst.path = std::string(host);
    return dst;
}

} // namespace meshdest::destination

#include <meshdest/protohttp/update_codec.h>

#include <array>

namespace meshdest::protohttp {

namespace {

std::uint64_t ReadBe64(const std::array<std::uint8_t, 16>& octets, std::size_t offset) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        v = (v << 8) | octets[offset + i];
    }
    return v;
}

void WriteBe64(std::array<std::uint8_t, 16>& octets, std::size_t offset, std::uint64_t v) {
    for (std::size_t i = 0; i < 8; ++i) {
        octets[offset + 7 - i] = static_cast<std::uint8_t>(v & 0xff);
        v >>= 8;
    }
}

} // namespace

api::net::TcpAddress ToProto(const destination::TcpAddress& addr) {
    api::net::TcpAddress out;
    out.set_port(addr.port);
    auto* ip = out.mutable_ip();
    if (addr.ip.is_v4()) {
        ip->set_ipv4(addr.ip.ToV4Uint());
    } else {
        auto* v6 = ip->mutable_ipv6();
        v6->set_first(ReadBe64(addr.ip.octets(), 0));
        v6->set_last(ReadBe64(addr.ip.octets(), 8));
    }
    return out;
}

Result<destination::TcpAddress> FromProto(const api::net::TcpAddress& addr) {
    if (addr.port() > 0xffff) {
        return Status(StatusCode::invalid_argument, "port out of range: " + std::to_string(addr.port()));
    }

    destination::TcpAddress out;
    out.port = static_cast<std::uint16_t>(addr.port());
    switch (addr.ip().ip_case()) {
        case api::net::IPAddress::kIpv4: {
            const auto v = addr.ip().ipv4();
            out.ip = destination::IpAddress::V4({static_cast<std::uint8_t>(v >> 24), static_cast<std::uint8_t>(v >> 16),
                                                static_cast<std::uint8_t>(v >> 8), static_cast<std::uint8_t>(v)});
            break;
        }
        case api::net::IPAddress::kIpv6: {
            std::array<std::uint8_t, 16> octets{};
            WriteBe64(octets, 0, addr.ip().ipv6().first());
            WriteBe64(octets, 8, addr.ip().ipv6().last());
            out.ip = destination::IpAddress::V6(octets);
            break;
        }
        default:
            return Status(StatusCode::invalid_argument, "address without an IP");
    }
    return out;
}

std::vector<api::destination::Update> DeltaToUpdates(const destination::Delta& delta) {
    std::vector<api::destination::Update> updates;

    if (!delta.added.empty()) {
        api::destination::Update u;
        auto* add = u.mutable_add();
        for (const auto& [k, v] : delta.labels) {
            (*add->mutable_metric_labels())[k] = v;
        }
        for (const auto& ep : delta.added) {
            auto* wa = add->add_addrs();
            *wa->mutable_addr() = ToProto(ep.address);
            wa->set_weight(ep.weight.value_or(kDefaultWeight));
            for (const auto& [k, v] : ep.metric_labels) {
                (*wa->mutable_metric_labels())[k] = v;
            }
            if (ep.identity) {
                wa->set_tls_identity(*ep.identity);
            }
            wa->set_opaque_protocol(ep.opaque_protocol);
            wa->set_hostname(ep.hostname);
        }
        updates.push_back(std::move(u));
    }

    if (!delta.removed.empty()) {
        api::destination::Update u;
        auto* remove = u.mutable_remove();
        for (const auto& ep : delta.removed) {
            *remove->add_addrs() = ToProto(ep.address);
        }
        updates.push_back(std::move(u));
    }

    if (delta.no_endpoints) {
        api::destination::Update u;
        u.mutable_no_endpoints()->set_exists(*delta.no_endpoints);
        updates.push_back(std::move(u));
    }

    return updates;
}

} // namespace meshdest::protohttp

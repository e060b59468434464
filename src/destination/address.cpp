#include <meshdest/destination/address.h>

#include <boost/asio/ip/address.hpp>
#include <boost/functional/hash.hpp>

#include <algorithm>

namespace meshdest::destination {

IpAddress IpAddress::V4(std::array<std::uint8_t, 4> octets) {
    IpAddress ip;
    ip.family_ = Family::v4;
    std::copy(octets.begin(), octets.end(), ip.octets_.begin());
    return ip;
}

IpAddress IpAddress::V6(std::array<std::uint8_t, 16> octets) {
    IpAddress ip;
    ip.family_ = Family::v6;
    ip.octets_ = octets;
    return ip;
}

Result<IpAddress> IpAddress::Parse(std::string_view text) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(std::string(text), ec);
    if (ec) {
        return Status(StatusCode::invalid_argument, "not an IP address: " + std::string(text));
    }
    if (addr.is_v4()) {
        return V4(addr.to_v4().to_bytes());
    }
    auto v6 = addr.to_v6();
    if (v6.scope_id() != 0) {
        return Status(StatusCode::invalid_argument, "scoped IPv6 addresses are not supported: " + std::string(text));
    }
    return V6(v6.to_bytes());
}

std::uint32_t IpAddress::ToV4Uint() const {
    if (!is_v4()) {
        return 0;
    }
    return (static_cast<std::uint32_t>(octets_[0]) << 24) | (static_cast<std::uint32_t>(octets_[1]) << 16) |
           (static_cast<std::uint32_t>(octets_[2]) << 8) | static_cast<std::uint32_t>(octets_[3]);
}

std::string IpAddress::ToString() const {
    if (is_v4()) {
        boost::asio::ip::address_v4::bytes_type bytes;
        std::copy_n(octets_.begin(), bytes.size(), bytes.begin());
        return boost::asio::ip::address_v4(bytes).to_string();
    }
    return boost::asio::ip::address_v6(octets_).to_string();
}

std::string TcpAddress::ToString() const {
    if (ip.is_v4()) {
        return ip.ToString() + ":" + std::to_string(port);
    }
    return "[" + ip.ToString() + "]:" + std::to_string(port);
}

std::size_t TcpAddressHash::operator()(const TcpAddress& addr) const {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<unsigned>(addr.ip.family()));
    boost::hash_range(seed, addr.ip.octets().begin(), addr.ip.octets().end());
    boost::hash_combine(seed, addr.port);
    return seed;
}

} // namespace meshdest::destination

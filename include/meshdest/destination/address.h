#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <meshdest/core/status.h>

namespace meshdest::destination {

// An IPv4 or IPv6 address held as raw network-order octets. IPv4 addresses
// use the first four octets only.
class IpAddress {
public:
    enum class Family : std::uint8_t { v4 = 4, v6 = 6 };

    IpAddress() = default;

    static IpAddress V4(std::array<std::uint8_t, 4> octets);
    static IpAddress V6(std::array<std::uint8_t, 16> octets);

    // Accepts dotted-quad IPv4 or textual IPv6 (without brackets).
    static Result<IpAddress> Parse(std::string_view text);

    Family family() const { return family_; }
    bool is_v4() const { return family_ == Family::v4; }
    const std::array<std::uint8_t, 16>& octets() const { return octets_; }

    // IPv4 as a host-order 32 bit integer; 0 for IPv6.
    std::uint32_t ToV4Uint() const;

    std::string ToString() const;

    auto operator<=>(const IpAddress&) const = default;

private:
    Family family_ = Family::v4;
    std::array<std::uint8_t, 16> octets_{};
};

struct TcpAddress {
    IpAddress ip;
    std::uint16_t port = 0;

    // "10.0.0.1:80" or "[fd00::1]:80"
    std::string ToString() const;

    auto operator<=>(const TcpAddress&) const = default;
};

struct TcpAddressHash {
    std::size_t operator()(const TcpAddress& addr) const;
};

} // namespace meshdest::destination

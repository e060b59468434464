#include <meshdest/resolvers/resolver_options.h>

#include <charconv>

namespace meshdest::resolvers {

namespace {

Result<std::uint16_t> ParsePortNumber(std::string_view text, std::string_view item) {
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || port > 65535) {
        return Status(StatusCode::invalid_argument, "invalid port: " + std::string(item));
    }
    return static_cast<std::uint16_t>(port);
}

} // namespace

std::set<std::uint16_t> DefaultOpaquePorts() {
    // SMTP, MySQL, Galera, PostgreSQL, Redis, Elasticsearch, Memcached.
    return {25, 587, 3306, 4444, 5432, 6379, 9300, 11211};
}

std::vector<std::string_view> SplitPortList(std::string_view text) {
    std::vector<std::string_view> items;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item = text.substr(0, comma);
        while (!item.empty() && item.front() == ' ') {
            item.remove_prefix(1);
        }
        while (!item.empty() && item.back() == ' ') {
            item.remove_suffix(1);
        }
        if (!item.empty()) {
            items.push_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return items;
}

Result<PortRange> ParsePortRange(std::string_view item) {
    auto dash = item.find('-');
    auto first = ParsePortNumber(item.substr(0, dash), item);
    if (!first.ok()) {
        return first.status();
    }
    if (dash == std::string_view::npos) {
        return PortRange{first.value(), first.value()};
    }
    auto last = ParsePortNumber(item.substr(dash + 1), item);
    if (!last.ok()) {
        return last.status();
    }
    if (last.value() < first.value()) {
        return Status(StatusCode::invalid_argument, "invalid port range: " + std::string(item));
    }
    return PortRange{first.value(), last.value()};
}

Result<std::set<std::uint16_t>> ParsePortList(std::string_view text) {
    std::set<std::uint16_t> ports;
    for (auto item : SplitPortList(text)) {
        auto range = ParsePortRange(item);
        if (!range.ok()) {
            return range.status();
        }
        for (unsigned p = range.value().first; p <= range.value().last; ++p) {
            ports.insert(static_cast<std::uint16_t>(p));
        }
    }
    return ports;
}

} // namespace meshdest::resolvers

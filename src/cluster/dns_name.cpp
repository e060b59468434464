#include <meshdest/cluster/dns_name.h>

#include <algorithm>
#include <cctype>

namespace meshdest::cluster {

namespace {

bool LabelCharOk(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
}

Status CheckLabel(std::string_view label) {
    if (label.empty()) {
        return Status(StatusCode::invalid_argument, "empty label in DNS name");
    }
    if (label.size() > 63) {
        return Status(StatusCode::invalid_argument, "DNS label too long: " + std::string(label));
    }
    if (!std::all_of(label.begin(), label.end(), LabelCharOk)) {
        return Status(StatusCode::invalid_argument, "invalid DNS label: " + std::string(label));
    }
    if (label.front() == '-' || label.back() == '-') {
        return Status(StatusCode::invalid_argument, "DNS label begins or ends with a dash: " + std::string(label));
    }
    const bool has_alpha = std::any_of(label.begin(), label.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    });
    if (!has_alpha) {
        return Status(StatusCode::invalid_argument, "DNS label is all digits: " + std::string(label));
    }
    return Status::Ok();
}

bool EqualFold(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

Result<std::vector<std::string>> SplitDnsName(std::string_view name) {
    if (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }

    std::vector<std::string> labels;
    for (;;) {
        const auto dot = name.find('.');
        const auto label = name.substr(0, dot);
        if (auto st = CheckLabel(label); !st.ok()) {
            return st;
        }
        labels.emplace_back(label);
        if (dot == std::string_view::npos) {
            break;
        }
        name.remove_prefix(dot + 1);
    }
    return labels;
}

std::optional<std::vector<std::string>> MaybeStripSuffixLabels(const std::vector<std::string>& labels,
                                                              const std::vector<std::string>& suffix) {
    if (suffix.size() > labels.size()) {
        return std::nullopt;
    }
    const auto offset = labels.size() - suffix.size();
    for (std::size_t i = 0; i < suffix.size(); ++i) {
        if (!EqualFold(labels[offset + i], suffix[i])) {
            return std::nullopt;
        }
    }
    return std::vector<std::string>(labels.begin(), labels.begin() + static_cast<std::ptrdiff_t>(offset));
}

Result<ServiceName> ParseServiceName(std::string_view host, std::string_view cluster_domain) {
    auto split = SplitDnsName(host);
    if (!split.ok()) {
        return split.status();
    }
    auto labels = std::move(split).value();

    // Strip the zone: the configured one first, then the default.
    for (std::string_view zone : {cluster_domain, std::string_view("cluster.local")}) {
        if (zone.empty()) {
            continue;
        }
        auto zone_labels = SplitDnsName(zone);
        if (!zone_labels.ok()) {
            continue;
        }
        if (auto stripped = MaybeStripSuffixLabels(labels, zone_labels.value())) {
            labels = std::move(*stripped);
            break;
        }
    }

    auto without_svc = MaybeStripSuffixLabels(labels, {"svc"});
    if (!without_svc) {
        return Status(StatusCode::invalid_argument, "not a service name: " + std::string(host));
    }
    labels = std::move(*without_svc);

    ServiceName out;
    if (labels.size() == 2) {
        out.id = ServiceId{labels[1], labels[0]};
    } else if (labels.size() == 3) {
        out.hostname = labels[0];
        out.id = ServiceId{labels[2], labels[1]};
    } else {
        return Status(StatusCode::invalid_argument, "not a service name: " + std::string(host));
    }
    return out;
}

} // namespace meshdest::cluster

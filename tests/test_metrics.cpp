#include <chtest.hpp>

#include <meshdest/core/metrics.h>

#include <string>

using meshdest::MetricLabels;
using meshdest::MetricsRegistry;

namespace {

MetricLabels Labels(std::string destination) {
    MetricLabels labels;
    labels.kv["destination"] = std::move(destination);
    return labels;
}

bool Contains(const MetricsRegistry& m, std::string_view needle) {
    return m.ToPrometheusText().find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Metrics exposition escapes label values") {
    MetricsRegistry m;
    m.CounterMetric("requests_total", "Requests", Labels("a\"b\\c\nd")).Inc(3);
    REQUIRE(Contains(m, "# TYPE requests_total counter\n"));
    REQUIRE(Contains(m, "requests_total{destination=\"a\\\"b\\\\c\\nd\"} 3\n"));
}

TEST_CASE("Metrics find-or-create returns the same series") {
    MetricsRegistry m;
    auto& a = m.GaugeMetric("streams", "Streams");
    auto& b = m.GaugeMetric("streams", "Streams");
    REQUIRE(&a == &b);
    a.Add(2);
    REQUIRE(Contains(m, "streams 2\n"));
}

TEST_CASE("Metrics removed series leave the exposition") {
    MetricsRegistry m;
    auto exists = m.AddGauge("destination_exists", "Exists", Labels("k8s://a:80"));
    auto updates = m.AddCounter("destination_updates_total", "Updates", Labels("k8s://a:80"));
    exists->Set(1);
    updates->Inc();
    REQUIRE(Contains(m, "destination_exists{destination=\"k8s://a:80\"} 1"));

    m.RemoveGauge("destination_exists", Labels("k8s://a:80"), exists.get());
    m.RemoveCounter("destination_updates_total", Labels("k8s://a:80"), updates.get());
    REQUIRE(m.ToPrometheusText().empty());

    // The owner may keep using a removed series.
    exists->Set(0);
    REQUIRE(m.ToPrometheusText().empty());
}

TEST_CASE("Metrics removal spares a replacement series") {
    MetricsRegistry m;
    auto old_exists = m.AddGauge("destination_exists", "Exists", Labels("k8s://a:80"));
    auto new_exists = m.AddGauge("destination_exists", "Exists", Labels("k8s://a:80"));
    REQUIRE(old_exists != new_exists);
    new_exists->Set(1);

    old_exists->Set(0);
    m.RemoveGauge("destination_exists", Labels("k8s://a:80"), old_exists.get());
    REQUIRE(Contains(m, "destination_exists{destination=\"k8s://a:80\"} 1"));

    m.RemoveGauge("destination_exists", Labels("k8s://a:80"), new_exists.get());
    REQUIRE(!Contains(m, "destination_exists"));
}

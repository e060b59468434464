#include <meshdest/core/metrics.h>

#include <sstream>

namespace meshdest {

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& it : kv) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << it.first << "=\"";
        for (char c : it.second) {
            if (c == '\\' || c == '"') {
                oss << '\\' << c;
            } else if (c == '\n') {
                oss << "\\n";
            } else {
                oss << c;
            }
        }
        oss << "\"";
    }
    oss << "}";
    return oss.str();
}

MetricsRegistry::Family& MetricsRegistry::FamilyLocked(std::string name, std::string help, Kind kind) {
    auto it = families_.find(name);
    if (it == families_.end()) {
        it = families_.emplace(std::move(name), Family{kind, std::move(help), {}, {}}).first;
    }
    return it->second;
}

Counter& MetricsRegistry::CounterMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& family = FamilyLocked(std::move(name), std::move(help), Kind::counter);
    auto& series = family.counters[labels.ToPrometheusLabelText()];
    if (!series) {
        series = std::make_shared<Counter>();
    }
    return *series;
}

Gauge& MetricsRegistry::GaugeMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& family = FamilyLocked(std::move(name), std::move(help), Kind::gauge);
    auto& series = family.gauges[labels.ToPrometheusLabelText()];
    if (!series) {
        series = std::make_shared<Gauge>();
    }
    return *series;
}

std::shared_ptr<Counter> MetricsRegistry::AddCounter(std::string name, std::string help, const MetricLabels& labels) {
    auto series = std::make_shared<Counter>();
    std::lock_guard<std::mutex> lk(mu_);
    FamilyLocked(std::move(name), std::move(help), Kind::counter).counters[labels.ToPrometheusLabelText()] = series;
    return series;
}

std::shared_ptr<Gauge> MetricsRegistry::AddGauge(std::string name, std::string help, const MetricLabels& labels) {
    auto series = std::make_shared<Gauge>();
    std::lock_guard<std::mutex> lk(mu_);
    FamilyLocked(std::move(name), std::move(help), Kind::gauge).gauges[labels.ToPrometheusLabelText()] = series;
    return series;
}

void MetricsRegistry::RemoveCounter(const std::string& name, const MetricLabels& labels, const Counter* series) {
    std::lock_guard<std::mutex> lk(mu_);
    auto family = families_.find(name);
    if (family == families_.end()) {
        return;
    }
    auto it = family->second.counters.find(labels.ToPrometheusLabelText());
    if (it == family->second.counters.end() || it->second.get() != series) {
        return;
    }
    family->second.counters.erase(it);
    if (family->second.counters.empty()) {
        families_.erase(family);
    }
}

void MetricsRegistry::RemoveGauge(const std::string& name, const MetricLabels& labels, const Gauge* series) {
    std::lock_guard<std::mutex> lk(mu_);
    auto family = families_.find(name);
    if (family == families_.end()) {
        return;
    }
    auto it = family->second.gauges.find(labels.ToPrometheusLabelText());
    if (it == family->second.gauges.end() || it->second.get() != series) {
        return;
    }
    family->second.gauges.erase(it);
    if (family->second.gauges.empty()) {
        families_.erase(family);
    }
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;

    for (const auto& [name, family] : families_) {
        oss << "# HELP " << name << " " << family.help << "\n";
        if (family.kind == Kind::counter) {
            oss << "# TYPE " << name << " counter\n";
            for (const auto& [labels, counter] : family.counters) {
                oss << name << labels << " " << counter->Value() << "\n";
            }
        } else {
            oss << "# TYPE " << name << " gauge\n";
            for (const auto& [labels, gauge] : family.gauges) {
                oss << name << labels << " " << gauge->Value() << "\n";
            }
        }
    }

    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace meshdest

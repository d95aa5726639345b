#include "common/Metrics.hpp"

#include <sstream>

namespace lmv::metrics {

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

std::uint64_t Registry::Snapshot::counter(const std::string& key) const {
    const auto it = counters.find(key);
    return it == counters.end() ? 0U : it->second;
}

double Registry::Snapshot::gauge(const std::string& key) const {
    const auto it = gauges.find(key);
    return it == gauges.end() ? 0.0 : it->second;
}

std::string Registry::Snapshot::summary() const {
    std::ostringstream out;
    out << "uptime=" << std::chrono::duration_cast<std::chrono::seconds>(capturedAt - startTime).count() << 's';
    for (const auto& [key, value] : counters) {
        out << ' ' << key << '=' << value;
    }
    for (const auto& [key, value] : gauges) {
        out << ' ' << key << '=' << value;
    }
    return out.str();
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::addGauge(const std::string& gaugeKey, double delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[gaugeKey] += delta;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters.insert(counters_.begin(), counters_.end());
    snapshot.gauges.insert(gauges_.begin(), gauges_.end());
    return snapshot;
}

}  // namespace lmv::metrics

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lmv::metrics {

// Process-wide counters and gauges for the feed and render pipeline. Keys are
// snake_case event names such as "ticks_accepted" or "entries_active".
class Registry {
public:
    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        // Ordered so that summaries read the same from run to run.
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, double> gauges;

        std::uint64_t counter(const std::string& key) const;
        double gauge(const std::string& key) const;
        // "uptime=12s ticks_accepted=40 ... entries_active=3"
        std::string summary() const;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void addGauge(const std::string& gaugeKey, double delta);
    Snapshot snapshot() const;

private:
    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, double> gauges_;
};

}  // namespace lmv::metrics

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tw::common::metrics {

// Process-wide counters, gauges and request latencies. Dumped to the log at shutdown.
class Registry {
public:
    // Latency samples kept per request name; the oldest sample is replaced once full.
    static constexpr std::size_t kLatencyWindow = 1024;

    // Counts one request under `name` and records its latency on destruction.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string name_;
        std::chrono::steady_clock::time_point started_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& key, std::uint64_t value = 1U);
    void setGauge(const std::string& key, double value);
    void recordLatency(const std::string& name, double millis);

    // One line per counter, gauge and request, each group sorted by name.
    std::vector<std::string> describe() const;

private:
    struct LatencyRing {
        std::uint64_t requests{0};
        std::vector<double> samples;
        std::size_t cursor{0};
    };

    Registry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, LatencyRing> latencies_;
};

}  // namespace tw::common::metrics

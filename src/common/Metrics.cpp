#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace tw::common::metrics {
namespace {

// Linear interpolation between the two closest ranks; `sorted` must be non-empty.
double percentile(const std::vector<double>& sorted, double p) {
    const double rank = p * static_cast<double>(sorted.size() - 1U);
    const auto below = static_cast<std::size_t>(std::floor(rank));
    const auto above = std::min(below + 1U, sorted.size() - 1U);
    const double frac = rank - static_cast<double>(below);
    return sorted[below] + frac * (sorted[above] - sorted[below]);
}

}  // namespace

Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

Registry::ScopedTimer::ScopedTimer(std::string name)
    : name_(std::move(name)), started_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const std::chrono::duration<double, std::milli> took = std::chrono::steady_clock::now() - started_;
    Registry::instance().recordLatency(name_, took.count());
}

void Registry::incrementCounter(const std::string& key, std::uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[key] += value;
}

void Registry::setGauge(const std::string& key, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[key] = value;
}

void Registry::recordLatency(const std::string& name, double millis) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& ring = latencies_[name];
    ++ring.requests;
    if (ring.samples.size() < kLatencyWindow) {
        ring.samples.push_back(millis);
        return;
    }
    ring.samples[ring.cursor] = millis;
    ring.cursor = (ring.cursor + 1U) % kLatencyWindow;
}

std::vector<std::string> Registry::describe() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> lines;
    lines.reserve(counters_.size() + gauges_.size() + latencies_.size());
    char line[256];

    for (const auto& [key, value] : counters_) {
        std::snprintf(line, sizeof(line), "counter %s=%llu", key.c_str(), static_cast<unsigned long long>(value));
        lines.emplace_back(line);
    }
    for (const auto& [key, value] : gauges_) {
        std::snprintf(line, sizeof(line), "gauge %s=%.3f", key.c_str(), value);
        lines.emplace_back(line);
    }
    for (const auto& [name, ring] : latencies_) {
        auto sorted = ring.samples;
        std::sort(sorted.begin(), sorted.end());
        std::snprintf(line, sizeof(line), "request %s total=%llu p50_ms=%.1f p95_ms=%.1f p99_ms=%.1f", name.c_str(),
                      static_cast<unsigned long long>(ring.requests), percentile(sorted, 0.50),
                      percentile(sorted, 0.95), percentile(sorted, 0.99));
        lines.emplace_back(line);
    }
    return lines;
}

}  // namespace tw::common::metrics

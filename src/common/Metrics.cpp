#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "common/Log.hpp"

namespace kfcp::common::metrics {
namespace {

double quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        return 0.0;
    }
    const double position = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1U);
    const auto lower = static_cast<std::size_t>(std::floor(position));
    const auto upper = static_cast<std::size_t>(std::ceil(position));
    const double weight = position - static_cast<double>(lower);
    return sorted[lower] + weight * (sorted[upper] - sorted[lower]);
}

}  // namespace

Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

Registry::ScopedTimer::ScopedTimer(std::string operation)
    : operation_(std::move(operation)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
        std::chrono::steady_clock::now() - start_);
    Registry::instance().recordLatency(operation_, elapsed.count());
}

void Registry::incrementCounter(const std::string& key, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[key] += value;
}

std::uint64_t Registry::counter(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0U : it->second;
}

void Registry::setGauge(const std::string& key, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[key] = value;
}

void Registry::recordLatency(const std::string& operation, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timer = timers_[operation];
    ++timer.count;
    if (timer.samples.size() < kMaxSamples) {
        timer.samples.push_back(latencyMs);
    } else {
        timer.samples[timer.next] = latencyMs;
        timer.next = (timer.next + 1U) % kMaxSamples;
    }
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters = counters_;
    snapshot.gauges = gauges_;
    for (const auto& [operation, timer] : timers_) {
        TimerSnapshot out;
        out.count = timer.count;
        if (!timer.samples.empty()) {
            auto sorted = timer.samples;
            std::sort(sorted.begin(), sorted.end());
            out.p50Ms = quantile(sorted, 0.50);
            out.p95Ms = quantile(sorted, 0.95);
            out.maxMs = sorted.back();
        }
        snapshot.timers.emplace(operation, out);
    }
    return snapshot;
}

void Registry::logSummary() const {
    const auto snap = snapshot();
    std::ostringstream oss;
    oss << "metrics:";
    for (const auto& [key, value] : snap.counters) {
        oss << ' ' << key << '=' << value;
    }
    for (const auto& [operation, timer] : snap.timers) {
        oss << ' ' << operation << ".count=" << timer.count;
        if (timer.p95Ms) {
            oss << ' ' << operation << ".p95_ms=" << *timer.p95Ms;
        }
    }
    LOG_INFO(oss.str());
}

}  // namespace kfcp::common::metrics

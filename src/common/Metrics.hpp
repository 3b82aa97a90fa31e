#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kfcp::common::metrics {

class Registry {
public:
    struct TimerSnapshot {
        std::uint64_t count{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
        std::optional<double> maxMs{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point capturedAt;
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, double> gauges;
        std::map<std::string, TimerSnapshot> timers;
    };

    // Records the elapsed time of its scope under `operation`.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string operation);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string operation_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& key, std::uint64_t value = 1U);
    std::uint64_t counter(const std::string& key) const;
    void setGauge(const std::string& key, double value);
    void recordLatency(const std::string& operation, double latencyMs);
    Snapshot snapshot() const;

    // One INFO line with every counter, for end-of-run summaries.
    void logSummary() const;

private:
    static constexpr std::size_t kMaxSamples = 4096;

    struct TimerSamples {
        std::uint64_t count{0};
        std::vector<double> samples;
        std::size_t next{0};
    };

    Registry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, TimerSamples> timers_;
};

inline void increment(const std::string& key, std::uint64_t value = 1U) {
    Registry::instance().incrementCounter(key, value);
}

}  // namespace kfcp::common::metrics

#include "app/FcpConfig.hpp"

#include <stdexcept>

#include "common/Config.hpp"
#include "domain/MarketCapabilities.hpp"

namespace app {

domain::TimestampMs FcpConfig::currentTime() const {
    if (now) {
        return now();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

FcpConfig FcpConfig::fromConfig(const kfcp::common::Config& config) {
    FcpConfig fcp{};

    const auto market = domain::market_from_string(config.market);
    if (!market) {
        throw std::invalid_argument("Unknown market: " + config.market);
    }
    fcp.market = *market;

    fcp.cacheEnabled = config.cacheEnabled;
    fcp.cacheRoot = config.cacheDir;
    fcp.cacheMaxAge = std::chrono::hours(24LL * config.cacheMaxAgeDays);

    fcp.planner.freshnessDelay = std::chrono::hours(config.freshnessHours);
    fcp.planner.liveOnlyMaxBars = config.liveOnlyMaxBars;

    fcp.coordinator.maxWorkers = config.workers;
    fcp.coordinator.retry.maxAttempts = static_cast<int>(config.retries);

    fcp.deadline.deadline = std::chrono::milliseconds(config.deadlineMs);
    fcp.deadline.grace = std::chrono::milliseconds(config.graceMs);
    return fcp;
}

}  // namespace app

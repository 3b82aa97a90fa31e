#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>

#include "app/DeadlineScope.hpp"
#include "app/FetchCoordinator.hpp"
#include "app/RangePlanner.hpp"
#include "domain/Types.h"

namespace kfcp::common {
struct Config;
}

namespace app {

// Everything a FailoverOrchestrator needs, fixed at construction.
struct FcpConfig {
    using NowFn = std::function<domain::TimestampMs()>;

    domain::DataProvider provider{domain::DataProvider::Binance};
    domain::MarketType market{domain::MarketType::Spot};

    bool cacheEnabled{true};
    std::filesystem::path cacheRoot{"./cache"};
    std::chrono::hours cacheMaxAge{24 * 30};

    PlannerConfig planner{};
    CoordinatorConfig coordinator{};
    DeadlineScope::Config deadline{};

    // Wall clock in epoch milliseconds; tests replace it.
    NowFn now{};

    domain::TimestampMs currentTime() const;

    static FcpConfig fromConfig(const kfcp::common::Config& config);
};

}  // namespace app

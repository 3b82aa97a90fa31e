#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace kfcp::common {

struct Config {
    kfcp::log::Level logLevel = kfcp::log::Level::Info;

    std::string symbol = "BTCUSDT";
    std::string interval = "1m";
    std::string from;
    std::string to = "now";
    std::string market = "spot";
    std::string source = "auto";  // auto | cache | bulk | live
    bool withSource = false;
    std::string outputPath;  // empty writes to stdout

    std::string cacheDir = "./cache";
    bool cacheEnabled = true;
    std::uint32_t cacheMaxAgeDays = 30;

    std::uint32_t freshnessHours = 48;
    std::size_t liveOnlyMaxBars = 0;
    std::size_t workers = 8;
    std::uint32_t retries = 5;
    std::uint32_t deadlineMs = 300000;
    std::uint32_t graceMs = 300;
    std::uint32_t httpTimeoutSec = 20;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace kfcp::common

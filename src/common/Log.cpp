#include "common/Log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace kfcp::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::atomic<std::uint64_t> g_nextRequest{1};
std::mutex g_outputMutex;
thread_local std::uint64_t t_request = 0;

const char* kLevelLabels[] = {"DEBUG", "INFO", "WARN", "ERROR"};

// Bars are keyed by UTC days, so log lines use UTC as well.
std::tm utcTime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void log(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const auto tm = utcTime(seconds);

    std::ostringstream line;
    line << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
         << "] [" << levelToString(level) << "] [thread " << std::this_thread::get_id() << "] ";
    if (t_request != 0) {
        line << "[req " << t_request << "] ";
    }
    line << message;

    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (level == Level::Warn || level == Level::Error) {
        std::cerr << line.str() << std::endl;
    } else {
        std::cout << line.str() << std::endl;
    }
}

std::uint64_t currentRequest() noexcept { return t_request; }

std::uint64_t nextRequestId() noexcept { return g_nextRequest.fetch_add(1, std::memory_order_relaxed); }

RequestScope::RequestScope(std::uint64_t id) noexcept : previous_(t_request) { t_request = id; }

RequestScope::~RequestScope() { t_request = previous_; }

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < (sizeof(kLevelLabels) / sizeof(kLevelLabels[0]))) {
        return kLevelLabels[index];
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw std::invalid_argument("unknown log level: " + std::string{text});
}

}  // namespace kfcp::log

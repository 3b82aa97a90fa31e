#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace kfcp::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Request id shown as "[req N]" on lines logged by the current thread; 0 means none.
std::uint64_t currentRequest() noexcept;
std::uint64_t nextRequestId() noexcept;

class RequestScope {
public:
    explicit RequestScope(std::uint64_t id) noexcept;
    ~RequestScope();

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

private:
    std::uint64_t previous_;
};

}  // namespace kfcp::log

#define KFCP_LOG_IMPL(level, expr)                                                         \
    do {                                                                                   \
        if (::kfcp::log::shouldLog(level)) {                                               \
            std::ostringstream kfcp_log_stream__;                                          \
            kfcp_log_stream__ << expr;                                                     \
            ::kfcp::log::log(level, kfcp_log_stream__.str());                              \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) KFCP_LOG_IMPL(::kfcp::log::Level::Debug, expr)
#define LOG_INFO(expr) KFCP_LOG_IMPL(::kfcp::log::Level::Info, expr)
#define LOG_WARN(expr) KFCP_LOG_IMPL(::kfcp::log::Level::Warn, expr)
#define LOG_ERR(expr) KFCP_LOG_IMPL(::kfcp::log::Level::Error, expr)

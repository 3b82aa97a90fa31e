#include "adapters/binance/BinanceRestClient.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "adapters/binance/Endpoints.hpp"
#include "adapters/binance/IntervalMap.hpp"
#include "common/Log.hpp"
#include "domain/IntervalMath.hpp"

namespace {

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

// "msg" of a Binance error body, or the raw body when it is not one.
std::string error_message(const std::string& body) {
    boost::system::error_code ec;
    const auto json = boost::json::parse(body, ec);
    if (!ec && json.is_object()) {
        if (const auto* msg = json.as_object().if_contains("msg"); msg != nullptr && msg->is_string()) {
            return std::string{msg->as_string().c_str()};
        }
    }
    return body.substr(0, 200);
}

}  // namespace

namespace adapters::binance {

namespace {
constexpr int kRateLimitPerMinute = 1200;
constexpr double kRateLimitThreshold = 0.9;
constexpr double kRateLimitThresholdValue = kRateLimitPerMinute * kRateLimitThreshold;
constexpr auto kThrottlePause = std::chrono::seconds(2);

using Clock = std::chrono::steady_clock;

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& header) {
    if (header.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const auto seconds = std::stoll(header, &consumed);
        if (consumed == header.size() && seconds >= 0) {
            return std::chrono::milliseconds(seconds * 1000);
        }
    } catch (const std::exception& ex) {
        LOG_DEBUG("Unparseable Retry-After '" << header << "': " << ex.what());
    }
    return std::nullopt;
}
}  // namespace

BinanceRestClient::BinanceRestClient(Options options)
    : options_(std::move(options)), market_(domain::capabilities_for(options_.market)) {}

bool BinanceRestClient::supports(const domain::Interval& interval) const { return market_.supports(interval); }

std::size_t BinanceRestClient::max_rows_per_call(const domain::Interval&) const { return market_.liveMaxRowsPerCall; }

domain::Result<std::vector<domain::Bar>> BinanceRestClient::fetch_bars(const domain::Symbol& symbol,
                                                                      const domain::Interval& interval,
                                                                      const domain::TimeRange& range,
                                                                      core::CancellationToken& cancel) {
    using Result = domain::Result<std::vector<domain::Bar>>;
    using domain::SourceErrorClass;

    if (!supports(interval)) {
        return Result::failure(domain::source_error(
            SourceErrorClass::InvalidRequest, "interval " + domain::interval_label(interval) + " not offered"));
    }
    const auto rows = domain::expected_count(range, interval);
    if (rows == 0) {
        return Result::success({});
    }
    if (rows > market_.liveMaxRowsPerCall) {
        return Result::failure(domain::source_error(
            SourceErrorClass::InvalidRequest,
            "range spans " + std::to_string(rows) + " rows, limit is " + std::to_string(market_.liveMaxRowsPerCall)));
    }

    const auto pauseUntil = Clock::time_point{Clock::duration{pauseUntil_.load(std::memory_order_relaxed)}};
    if (pauseUntil > Clock::now() && !cancel.sleep_until(pauseUntil)) {
        return Result::failure(domain::make_error(domain::ErrorKind::Cancelled, cancel.reason()));
    }

    const auto endpoint = rest_endpoint(options_.market);
    std::ostringstream target;
    target << endpoint.klinesPath << "?symbol=" << symbol << "&interval=" << binance_interval(options_.market, interval)
           << "&startTime=" << range.start << "&endTime=" << (range.end - 1) << "&limit=" << rows;
    const std::string request_target = target.str();
    LOG_DEBUG("Binance REST " << endpoint.host << request_target);

    infra::http::RequestOptions requestOptions{};
    requestOptions.timeout_sec = options_.timeoutSec;
    requestOptions.cancel = &cancel;

    infra::http::HttpResponse response;
    try {
        response = http_get(options_.http, endpoint.host, request_target, requestOptions);
    } catch (const infra::http::HttpError& ex) {
        return Result::failure(classify_http_error(ex));
    }

    const unsigned status = response.status;
    if (status == 429U || status == 418U) {
        return Result::failure(domain::source_error(SourceErrorClass::RateLimited,
                                                    "HTTP " + std::to_string(status) + ": " +
                                                        error_message(response.body),
                                                    parse_retry_after(response.retry_after_header)));
    }
    if (status >= 500U) {
        return Result::failure(
            domain::source_error(SourceErrorClass::Network, "HTTP " + std::to_string(status) + " from Binance"));
    }
    if (status == 400U) {
        return Result::failure(domain::source_error(SourceErrorClass::InvalidRequest,
                                                    "HTTP 400: " + error_message(response.body)));
    }
    if (status != 200U) {
        return Result::failure(domain::source_error(SourceErrorClass::Permanent,
                                                    "HTTP " + std::to_string(status) + ": " +
                                                        error_message(response.body)));
    }

    throttle_(response.used_weight_header);

    std::vector<domain::Bar> parsed;
    try {
        parsed = parse_klines(response.body);
    } catch (const std::exception& ex) {
        return Result::failure(
            domain::source_error(SourceErrorClass::Network, std::string{"Malformed klines response: "} + ex.what()));
    }

    std::vector<domain::Bar> bars;
    bars.reserve(parsed.size());
    for (const auto& bar : parsed) {
        if (!range.contains(bar.openTime)) {
            continue;
        }
        if (!bars.empty() && bar.openTime <= bars.back().openTime) {
            continue;
        }
        bars.push_back(bar);
    }
    return Result::success(std::move(bars));
}

std::vector<domain::Bar> BinanceRestClient::parse_klines(const std::string& body) {
    boost::json::value json;
    try {
        json = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse Binance response: "} + ex.what());
    }

    if (!json.is_array()) {
        throw std::runtime_error("Unexpected Binance response type (expected array)");
    }

    std::vector<domain::Bar> bars;
    const auto& outer = json.as_array();
    bars.reserve(outer.size());
    for (const auto& row_value : outer) {
        if (!row_value.is_array()) {
            throw std::runtime_error("Unexpected Binance kline row type");
        }
        const auto& row = row_value.as_array();
        if (row.size() < 6) {
            throw std::runtime_error("Incomplete Binance kline row");
        }

        domain::Bar bar{};
        bar.openTime = json_to_int64(row.at(0));
        bar.open = json_to_double(row.at(1));
        bar.high = json_to_double(row.at(2));
        bar.low = json_to_double(row.at(3));
        bar.close = json_to_double(row.at(4));
        bar.volume = json_to_double(row.at(5));
        bars.push_back(bar);
    }
    return bars;
}

void BinanceRestClient::throttle_(const std::string& usedWeightHeader) {
    if (usedWeightHeader.empty()) {
        return;
    }
    try {
        const int used_weight = std::stoi(usedWeightHeader);
        if (static_cast<double>(used_weight) > kRateLimitThresholdValue) {
            const auto until = Clock::now() + kThrottlePause;
            pauseUntil_.store(until.time_since_epoch().count(), std::memory_order_relaxed);
            LOG_INFO("Binance used weight " << used_weight << ", pausing REST calls for "
                                            << std::chrono::duration_cast<std::chrono::milliseconds>(kThrottlePause).count()
                                            << " ms");
        }
    } catch (const std::exception& ex) {
        LOG_DEBUG("Malformed X-MBX-USED-WEIGHT header '" << usedWeightHeader << "': " << ex.what());
    }
}

}  // namespace adapters::binance

#include "adapters/binance/VisionClient.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "adapters/binance/Endpoints.hpp"
#include "adapters/binance/IntervalMap.hpp"
#include "common/Log.hpp"
#include "domain/IntervalMath.hpp"
#include "infra/archive/ZipReader.hpp"
#include "infra/crypto/Sha256.hpp"

namespace adapters::binance {
namespace {

using domain::SourceErrorClass;
using domain::TimestampMs;

// Spot archives switched to microsecond timestamps in 2025.
constexpr long long kMicrosecondThreshold = 100'000'000'000'000LL;

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (start <= line.size()) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

long long parseInteger(std::string_view text, std::size_t lineNo) {
    long long value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        throw std::runtime_error("line " + std::to_string(lineNo) + ": bad integer '" + std::string{text} + "'");
    }
    return value;
}

double parseDouble(std::string_view text, std::size_t lineNo) {
    const std::string copy{text};
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (copy.empty() || end != copy.c_str() + copy.size()) {
        throw std::runtime_error("line " + std::to_string(lineNo) + ": bad number '" + copy + "'");
    }
    return value;
}

bool isHex(std::string_view text) {
    for (const char ch : text) {
        if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
    }
    return true;
}

std::string toLowerCopy(std::string_view text) {
    std::string out{text};
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

}  // namespace

VisionClient::VisionClient(Options options)
    : options_(std::move(options)), market_(domain::capabilities_for(options_.market)) {}

bool VisionClient::supports(const domain::Interval& interval) const { return market_.bulkSupports(interval); }

std::size_t VisionClient::max_rows_per_call(const domain::Interval& interval) const {
    if (!supports(interval)) {
        return 0;
    }
    return static_cast<std::size_t>(domain::kMillisPerDay / interval.ms);
}

std::string VisionClient::archive_target(const domain::Symbol& symbol,
                                         const domain::Interval& interval,
                                         TimestampMs dayStart) const {
    const auto literal = binance_interval(options_.market, interval);
    std::ostringstream target;
    target << "/data/" << vision_market_path(options_.market) << "/daily/klines/" << symbol << '/' << literal << '/'
           << symbol << '-' << literal << '-' << domain::format_date(dayStart) << ".zip";
    return target.str();
}

domain::Result<std::vector<domain::Bar>> VisionClient::fetch_bars(const domain::Symbol& symbol,
                                                                 const domain::Interval& interval,
                                                                 const domain::TimeRange& range,
                                                                 core::CancellationToken& cancel) {
    using Result = domain::Result<std::vector<domain::Bar>>;

    if (!supports(interval)) {
        return Result::failure(domain::source_error(
            SourceErrorClass::InvalidRequest, "no daily archives for " + domain::interval_label(interval)));
    }
    if (domain::expected_count(range, interval) > max_rows_per_call(interval)) {
        return Result::failure(
            domain::source_error(SourceErrorClass::InvalidRequest, "range wider than one day of rows"));
    }

    std::vector<domain::Bar> bars;
    for (auto day = domain::day_start(range.start); day < range.end; day += domain::kMillisPerDay) {
        if (cancel.cancelled()) {
            return Result::failure(domain::make_error(domain::ErrorKind::Cancelled, cancel.reason()));
        }
        auto dayBars = fetchDay_(symbol, interval, day, cancel);
        if (dayBars.failed()) {
            return dayBars;
        }
        for (const auto& bar : dayBars.value) {
            if (range.contains(bar.openTime) && (bars.empty() || bar.openTime > bars.back().openTime)) {
                bars.push_back(bar);
            }
        }
    }
    return Result::success(std::move(bars));
}

domain::Result<std::vector<domain::Bar>> VisionClient::fetchDay_(const domain::Symbol& symbol,
                                                                const domain::Interval& interval,
                                                                TimestampMs dayStart,
                                                                core::CancellationToken& cancel) {
    using Result = domain::Result<std::vector<domain::Bar>>;
    const auto target = archive_target(symbol, interval, dayStart);
    LOG_DEBUG("Binance Vision " << kVisionHost << target);

    try {
        std::optional<std::string> expectedDigest;
        if (options_.verifyChecksum) {
            const auto checksum = get_(target + ".CHECKSUM", cancel);
            if (checksum.status == 200U) {
                expectedDigest = parse_checksum(checksum.body);
                if (!expectedDigest) {
                    return Result::failure(
                        domain::source_error(SourceErrorClass::ChecksumMismatch, "unreadable checksum file"));
                }
            } else if (checksum.status == 404U || checksum.status == 403U) {
                LOG_WARN("No checksum published for " << target << ", continuing unverified");
            } else {
                return Result::failure(classifyStatus_(checksum.status, dayStart, "checksum"));
            }
        }

        const auto archive = get_(target, cancel);
        if (archive.status != 200U) {
            return Result::failure(classifyStatus_(archive.status, dayStart, "archive"));
        }

        if (expectedDigest) {
            const auto actual = infra::crypto::sha256_hex(archive.body);
            if (actual != *expectedDigest) {
                return Result::failure(domain::source_error(
                    SourceErrorClass::ChecksumMismatch, "sha256 " + actual + " != published " + *expectedDigest));
            }
        }

        const infra::archive::ZipReader zip{archive.body};
        for (const auto& entry : zip.entries()) {
            if (entry.name.size() >= 4 && entry.name.compare(entry.name.size() - 4, 4, ".csv") == 0) {
                return Result::success(parse_csv(zip.extract(entry)));
            }
        }
        return Result::failure(domain::source_error(SourceErrorClass::Permanent, "archive holds no CSV entry"));
    } catch (const infra::http::HttpError& ex) {
        return Result::failure(classify_http_error(ex));
    } catch (const infra::archive::ZipError& ex) {
        return Result::failure(domain::source_error(SourceErrorClass::ChecksumMismatch, ex.what()));
    } catch (const std::runtime_error& ex) {
        return Result::failure(
            domain::source_error(SourceErrorClass::Permanent, std::string{"unreadable archive: "} + ex.what()));
    }
}

domain::FetchError VisionClient::classifyStatus_(unsigned status, TimestampMs dayStart, const std::string& what) const {
    const auto message = what + " HTTP " + std::to_string(status) + " for " + domain::format_date(dayStart);
    if (status == 404U || status == 403U) {
        // Archives appear some time after the day closes.
        const bool recent = dayStart + domain::kMillisPerDay > now_() - options_.freshnessDelay.count();
        return domain::source_error(recent ? SourceErrorClass::NotYetAvailable : SourceErrorClass::NotFound, message);
    }
    if (status == 429U || status == 418U) {
        return domain::source_error(SourceErrorClass::RateLimited, message);
    }
    if (status >= 500U) {
        return domain::source_error(SourceErrorClass::Network, message);
    }
    return domain::source_error(SourceErrorClass::Permanent, message);
}

infra::http::HttpResponse VisionClient::get_(const std::string& target, core::CancellationToken& cancel) const {
    infra::http::RequestOptions requestOptions{};
    requestOptions.timeout_sec = options_.timeoutSec;
    requestOptions.accept = "*/*";
    requestOptions.cancel = &cancel;
    return http_get(options_.http, kVisionHost, target, requestOptions);
}

TimestampMs VisionClient::now_() const {
    if (options_.now) {
        return options_.now();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::vector<domain::Bar> VisionClient::parse_csv(std::string_view text) {
    std::vector<domain::Bar> bars;
    std::size_t lineNo = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto newline = text.find('\n', pos);
        if (newline == std::string_view::npos) {
            newline = text.size();
        }
        auto line = text.substr(pos, newline - pos);
        pos = newline + 1;
        ++lineNo;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(line.front())) == 0) {
            if (bars.empty() && lineNo == 1) {
                continue;
            }
            throw std::runtime_error("line " + std::to_string(lineNo) + ": unexpected text row");
        }

        const auto fields = splitFields(line);
        if (fields.size() < 6) {
            throw std::runtime_error("line " + std::to_string(lineNo) + ": expected at least 6 columns");
        }

        domain::Bar bar{};
        bar.openTime = parseInteger(fields[0], lineNo);
        if (bar.openTime >= kMicrosecondThreshold) {
            bar.openTime /= 1000;
        }
        bar.open = parseDouble(fields[1], lineNo);
        bar.high = parseDouble(fields[2], lineNo);
        bar.low = parseDouble(fields[3], lineNo);
        bar.close = parseDouble(fields[4], lineNo);
        bar.volume = parseDouble(fields[5], lineNo);
        bars.push_back(bar);
    }
    return bars;
}

std::optional<std::string> VisionClient::parse_checksum(std::string_view text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    const auto end = text.find_first_of(" \t\r\n", begin);
    const auto digest = text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
    if (digest.size() != 64 || !isHex(digest)) {
        return std::nullopt;
    }
    return toLowerCopy(digest);
}

}  // namespace adapters::binance

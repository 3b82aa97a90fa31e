#include "infra/storage/DailyBarCache.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

#include <zlib.h>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/IntervalMath.hpp"
#include "infra/storage/BarFileFormat.h"

namespace fs = std::filesystem;

namespace infra::storage {
namespace {

using domain::Bar;
using domain::TimestampMs;

std::atomic<std::uint64_t> g_tempCounter{0};

std::uint32_t payloadCrc(const std::vector<char>& payload) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(payload.data()), static_cast<uInt>(payload.size()));
    return static_cast<std::uint32_t>(crc);
}

std::vector<char> encodeColumns(const std::vector<Bar>& bars) {
    const auto rows = bars.size();
    std::vector<char> payload(rows * kBytesPerRow);
    char* cursor = payload.data();

    for (const auto& bar : bars) {
        const std::int64_t openTime = bar.openTime;
        std::memcpy(cursor, &openTime, sizeof(openTime));
        cursor += sizeof(openTime);
    }
    const auto writeColumn = [&](double Bar::*field) {
        for (const auto& bar : bars) {
            const double value = bar.*field;
            std::memcpy(cursor, &value, sizeof(value));
            cursor += sizeof(value);
        }
    };
    writeColumn(&Bar::open);
    writeColumn(&Bar::high);
    writeColumn(&Bar::low);
    writeColumn(&Bar::close);
    writeColumn(&Bar::volume);
    return payload;
}

std::vector<Bar> decodeColumns(const std::vector<char>& payload, std::size_t rows) {
    std::vector<Bar> bars(rows);
    const char* cursor = payload.data();

    for (auto& bar : bars) {
        std::int64_t openTime = 0;
        std::memcpy(&openTime, cursor, sizeof(openTime));
        bar.openTime = static_cast<TimestampMs>(openTime);
        cursor += sizeof(openTime);
    }
    const auto readColumn = [&](double Bar::*field) {
        for (auto& bar : bars) {
            double value = 0.0;
            std::memcpy(&value, cursor, sizeof(value));
            bar.*field = value;
            cursor += sizeof(value);
        }
    };
    readColumn(&Bar::open);
    readColumn(&Bar::high);
    readColumn(&Bar::low);
    readColumn(&Bar::close);
    readColumn(&Bar::volume);
    return bars;
}

void copyLabel(char* dest, std::size_t capacity, const std::string& value) {
    std::memset(dest, 0, capacity);
    std::memcpy(dest, value.data(), std::min(value.size(), capacity - 1));
}

std::string labelOf(const char* source, std::size_t capacity) {
    return std::string(source, strnlen(source, capacity));
}

// Rows must be aligned, strictly increasing, inside the day and sane.
std::string checkRows(const std::vector<Bar>& bars, const domain::Interval& interval, TimestampMs dayStart) {
    const TimestampMs dayEnd = dayStart + domain::kMillisPerDay;
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        if (bar.openTime < dayStart || bar.openTime >= dayEnd) {
            return "row " + std::to_string(i) + " outside of day";
        }
        if (!domain::is_aligned(bar.openTime, interval)) {
            return "row " + std::to_string(i) + " not aligned to interval";
        }
        if (i > 0 && bar.openTime <= bars[i - 1].openTime) {
            return "row " + std::to_string(i) + " breaks ascending order";
        }
        if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
            !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
            return "row " + std::to_string(i) + " has non-finite values";
        }
        if (bar.high < bar.low) {
            return "row " + std::to_string(i) + " has high < low";
        }
        if (bar.volume < 0.0) {
            return "row " + std::to_string(i) + " has negative volume";
        }
    }
    return {};
}

std::string checkCompleteness(const std::vector<Bar>& bars,
                              const domain::Interval& interval,
                              TimestampMs dayStart,
                              bool truncatedStart) {
    if (bars.empty()) {
        return "no rows";
    }
    const TimestampMs dayEnd = dayStart + domain::kMillisPerDay;
    const auto expectedDay = domain::expected_count(domain::TimeRange{dayStart, dayEnd}, interval);
    if (bars.size() == expectedDay) {
        return {};
    }
    if (truncatedStart) {
        const auto expectedTail = domain::expected_count(domain::TimeRange{bars.front().openTime, dayEnd}, interval);
        if (bars.size() == expectedTail) {
            return {};
        }
        return "truncated day has " + std::to_string(bars.size()) + " rows, expected " +
               std::to_string(expectedTail);
    }
    return "day has " + std::to_string(bars.size()) + " rows, expected " + std::to_string(expectedDay);
}

}  // namespace

DailyBarCache::DailyBarCache(Options options) : options_(std::move(options)) {}

fs::path DailyBarCache::pathFor(const domain::CacheKey& key) const {
    return options_.root / domain::to_string(key.provider) / domain::to_string(key.market) / "klines" / "daily" /
           key.symbol / domain::interval_label(key.interval) / (domain::format_day(key.dayStart) + ".kbar");
}

CacheLookup DailyBarCache::read(const domain::CacheKey& key) const {
    namespace metrics = kfcp::common::metrics;

    CacheLookup lookup{};
    if (!domain::divides_day(key.interval)) {
        lookup.reason = "interval is not cached";
        return lookup;
    }

    lookup = readFile_(pathFor(key), key, true);
    switch (lookup.status) {
    case CacheStatus::Hit:
        metrics::increment("cache.hits");
        LOG_DEBUG("Cache hit " << key.id() << " rows=" << lookup.bars.size());
        break;
    case CacheStatus::Miss:
        metrics::increment("cache.misses");
        break;
    case CacheStatus::Invalid:
        metrics::increment("cache.invalid");
        LOG_WARN("Cache integrity check failed for " << key.id() << ": " << lookup.reason
                                                     << " (treated as miss)");
        break;
    }
    return lookup;
}

domain::Result<std::size_t> DailyBarCache::write(const domain::CacheKey& key,
                                                 const std::vector<Bar>& bars,
                                                 bool truncatedStart) const {
    using Result = domain::Result<std::size_t>;

    if (auto problem = validateDay_(key, bars, truncatedStart); !problem.empty()) {
        return Result::failure(domain::make_error(domain::ErrorKind::CacheIntegrity,
                                                  "refusing to cache " + key.id() + ": " + problem));
    }

    const auto finalPath = pathFor(key);
    std::error_code ec;
    fs::create_directories(finalPath.parent_path(), ec);
    if (ec) {
        return Result::failure(domain::make_error(domain::ErrorKind::CacheIntegrity,
                                                  "cannot create " + finalPath.parent_path().string() + ": " +
                                                      ec.message()));
    }

    const auto payload = encodeColumns(bars);
    BarFileHeader header{};
    header.intervalMs = key.interval.ms;
    header.dayStart = key.dayStart;
    header.rowCount = bars.size();
    header.flags = truncatedStart ? kFlagTruncatedStart : 0U;
    header.payloadCrc = payloadCrc(payload);
    copyLabel(header.symbol, sizeof(header.symbol), key.symbol);
    copyLabel(header.interval, sizeof(header.interval), domain::interval_label(key.interval));

    const auto tempPath = tempPathFor_(finalPath);
    const auto fail = [&](const std::string& message) {
        std::error_code removeEc;
        fs::remove(tempPath, removeEc);
        return Result::failure(domain::make_error(domain::ErrorKind::CacheIntegrity, message));
    };

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return fail("cannot open temp file " + tempPath.string());
        }
        ofs.write(reinterpret_cast<const char*>(&header), sizeof(header));
        ofs.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        ofs.flush();
        if (!ofs) {
            return fail("short write to " + tempPath.string());
        }
    }

    // Re-read what landed on disk before it becomes visible.
    const auto verify = readFile_(tempPath, key, false);
    if (!verify.ok()) {
        return fail("verification of " + tempPath.string() + " failed: " + verify.reason);
    }
    if (verify.bars.size() != bars.size()) {
        return fail("verification of " + tempPath.string() + " read back a different row count");
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        return fail("rename to " + finalPath.string() + " failed: " + ec.message());
    }

    kfcp::common::metrics::increment("cache.writes");
    LOG_INFO("Cached " << key.id() << " rows=" << bars.size() << (truncatedStart ? " (truncated start)" : ""));
    return Result::success(bars.size());
}

CacheLookup DailyBarCache::readFile_(const fs::path& path, const domain::CacheKey& key, bool checkAge) const {
    CacheLookup lookup{};

    struct ::stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        lookup.status = CacheStatus::Miss;
        lookup.reason = "not found";
        return lookup;
    }

    const auto invalid = [&lookup](std::string reason) {
        lookup.status = CacheStatus::Invalid;
        lookup.reason = std::move(reason);
        lookup.bars.clear();
        return lookup;
    };

    const auto fileSize = static_cast<std::uint64_t>(info.st_size);
    if (fileSize < sizeof(BarFileHeader) + kBytesPerRow) {
        return invalid("file too small (" + std::to_string(fileSize) + " bytes)");
    }

    if (checkAge && options_.maxAge.count() > 0) {
        const auto ageSeconds = static_cast<long long>(std::time(nullptr)) - static_cast<long long>(info.st_mtime);
        const auto maxAgeSeconds = std::chrono::duration_cast<std::chrono::seconds>(options_.maxAge).count();
        if (ageSeconds > maxAgeSeconds) {
            return invalid("file is stale (" + std::to_string(ageSeconds / 3600) + "h old)");
        }
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return invalid("cannot open file");
    }

    BarFileHeader header;
    if (!ifs.read(reinterpret_cast<char*>(&header), sizeof(header))) {
        return invalid("cannot read header");
    }
    if (std::memcmp(header.magic, kBarFileMagic, sizeof(header.magic)) != 0) {
        return invalid("bad magic");
    }
    if (header.version != kBarFileVersion) {
        return invalid("unsupported format version " + std::to_string(header.version));
    }
    if (header.columnCount != kBarFileColumns) {
        return invalid("unexpected column count " + std::to_string(header.columnCount));
    }
    if (header.intervalMs != key.interval.ms ||
        labelOf(header.interval, sizeof(header.interval)) != domain::interval_label(key.interval)) {
        return invalid("interval does not match key");
    }
    if (header.dayStart != key.dayStart) {
        return invalid("day does not match key");
    }
    if (labelOf(header.symbol, sizeof(header.symbol)) != key.symbol) {
        return invalid("symbol does not match key");
    }
    if (header.rowCount == 0 || fileSize != sizeof(BarFileHeader) + header.rowCount * kBytesPerRow) {
        return invalid("size " + std::to_string(fileSize) + " does not match row count " +
                       std::to_string(header.rowCount));
    }

    std::vector<char> payload(static_cast<std::size_t>(header.rowCount * kBytesPerRow));
    if (!ifs.read(payload.data(), static_cast<std::streamsize>(payload.size()))) {
        return invalid("cannot read columns");
    }
    if (payloadCrc(payload) != header.payloadCrc) {
        return invalid("payload checksum mismatch");
    }

    auto bars = decodeColumns(payload, static_cast<std::size_t>(header.rowCount));
    if (auto problem = checkRows(bars, key.interval, key.dayStart); !problem.empty()) {
        return invalid(problem);
    }
    const bool truncated = (header.flags & kFlagTruncatedStart) != 0U;
    if (auto problem = checkCompleteness(bars, key.interval, key.dayStart, truncated); !problem.empty()) {
        return invalid(problem);
    }

    lookup.status = CacheStatus::Hit;
    lookup.bars = std::move(bars);
    lookup.truncatedStart = truncated;
    return lookup;
}

std::string DailyBarCache::validateDay_(const domain::CacheKey& key,
                                        const std::vector<Bar>& bars,
                                        bool truncatedStart) const {
    if (key.symbol.empty() || key.symbol.size() >= sizeof(BarFileHeader::symbol)) {
        return "invalid symbol";
    }
    if (!domain::divides_day(key.interval)) {
        return "interval " + domain::interval_label(key.interval) + " is not cacheable";
    }
    if (key.dayStart != domain::day_start(key.dayStart)) {
        return "key day is not a UTC midnight";
    }
    if (key.dayStart + domain::kMillisPerDay > now_()) {
        return "day has not closed yet";
    }
    if (auto problem = checkRows(bars, key.interval, key.dayStart); !problem.empty()) {
        return problem;
    }
    return checkCompleteness(bars, key.interval, key.dayStart, truncatedStart);
}

fs::path DailyBarCache::tempPathFor_(const fs::path& finalPath) const {
    std::ostringstream name;
    name << finalPath.filename().string() << ".tmp." << ::getpid() << '.'
         << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '.'
         << g_tempCounter.fetch_add(1, std::memory_order_relaxed);
    return finalPath.parent_path() / name.str();
}

TimestampMs DailyBarCache::now_() const {
    if (options_.now) {
        return options_.now();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace infra::storage

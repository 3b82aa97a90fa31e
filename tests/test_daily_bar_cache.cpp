#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <unistd.h>

#include "domain/CacheKey.hpp"
#include "domain/IntervalMath.hpp"
#include "infra/storage/BarFileFormat.h"
#include "infra/storage/DailyBarCache.hpp"

namespace fs = std::filesystem;

namespace {

using domain::Bar;
using domain::TimestampMs;

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() /
               ("kfcp_cache_test_" + std::to_string(::getpid()) + "_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::vector<Bar> makeDay(TimestampMs dayStart, const domain::Interval& interval, TimestampMs from = -1) {
    std::vector<Bar> bars;
    const domain::TimeRange day{from < 0 ? dayStart : from, dayStart + domain::kMillisPerDay};
    for (const auto t : domain::expected_open_times(day, interval)) {
        const double base = 100.0 + static_cast<double>((t - dayStart) / interval.ms);
        bars.push_back(Bar{t, base, base + 2.0, base - 1.0, base + 0.5, 10.0});
    }
    return bars;
}

bool writeAll(const fs::path& path, const std::vector<char>& bytes) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(ofs);
}

std::vector<char> readAll(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
    using infra::storage::CacheStatus;
    using infra::storage::DailyBarCache;

    const auto oneHour = domain::interval_from_label("1h");
    const auto day = domain::utc_timestamp(2024, 3, 1);
    const auto now = domain::utc_timestamp(2024, 3, 10);

    domain::CacheKey key{};
    key.symbol = "BTCUSDT";
    key.interval = oneHour;
    key.dayStart = day;

    {
        TempDir dir;
        DailyBarCache cache({dir.path, std::chrono::hours(0), [now]() { return now; }});

        if (cache.read(key).status != CacheStatus::Miss) {
            std::cerr << "Empty cache should miss\n";
            return 1;
        }

        const auto bars = makeDay(day, oneHour);
        const auto written = cache.write(key, bars);
        if (written.failed() || written.value != 24) {
            std::cerr << "Write failed: " << written.error.describe() << "\n";
            return 1;
        }
        const auto lookup = cache.read(key);
        if (!lookup.ok() || lookup.bars != bars || lookup.truncatedStart) {
            std::cerr << "Read back differs from what was written (" << lookup.reason << ")\n";
            return 1;
        }
        if (cache.pathFor(key).filename() != "20240301.kbar") {
            std::cerr << "Unexpected cache file name " << cache.pathFor(key) << "\n";
            return 1;
        }
        for (const auto& entry : fs::directory_iterator(cache.pathFor(key).parent_path())) {
            if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
                std::cerr << "Temp file left behind: " << entry.path() << "\n";
                return 1;
            }
        }
    }

    {
        TempDir dir;
        DailyBarCache cache({dir.path, std::chrono::hours(0), [now]() { return now; }});

        auto partial = makeDay(day, oneHour);
        partial.erase(partial.begin() + 5);
        if (!cache.write(key, partial).failed()) {
            std::cerr << "A day with a hole must not be cached\n";
            return 1;
        }

        auto misaligned = makeDay(day, oneHour);
        misaligned[3].openTime += 1;
        if (!cache.write(key, misaligned).failed()) {
            std::cerr << "Misaligned rows must not be cached\n";
            return 1;
        }

        DailyBarCache early({dir.path, std::chrono::hours(0), [day]() { return day + domain::kMillisPerHour; }});
        if (!early.write(key, makeDay(day, oneHour)).failed()) {
            std::cerr << "An open day must not be cached\n";
            return 1;
        }

        // First listing day: bars start at 09:00 and run to the end of the day.
        const auto listed = makeDay(day, oneHour, day + 9 * domain::kMillisPerHour);
        if (!cache.write(key, listed).failed()) {
            std::cerr << "A short day without the truncated flag must be rejected\n";
            return 1;
        }
        const auto truncated = cache.write(key, listed, true);
        const auto lookup = cache.read(key);
        if (truncated.failed() || !lookup.ok() || !lookup.truncatedStart || lookup.bars.size() != 15) {
            std::cerr << "Truncated first day should round trip with its flag\n";
            return 1;
        }
    }

    {
        TempDir dir;
        DailyBarCache cache({dir.path, std::chrono::hours(0), [now]() { return now; }});
        const auto bars = makeDay(day, oneHour);
        if (cache.write(key, bars).failed()) {
            std::cerr << "Setup write failed\n";
            return 1;
        }
        const auto path = cache.pathFor(key);
        const auto pristine = readAll(path);

        auto badMagic = pristine;
        badMagic[0] = 'X';
        writeAll(path, badMagic);
        const auto magicLookup = cache.read(key);
        if (magicLookup.status != CacheStatus::Invalid || !magicLookup.bars.empty()) {
            std::cerr << "Bad magic must be reported as invalid\n";
            return 1;
        }

        auto truncatedFile = pristine;
        truncatedFile.resize(truncatedFile.size() - 7);
        writeAll(path, truncatedFile);
        if (cache.read(key).status != CacheStatus::Invalid) {
            std::cerr << "Truncated file must be reported as invalid\n";
            return 1;
        }

        auto flipped = pristine;
        flipped[sizeof(infra::storage::BarFileHeader) + 3] ^= 0x40;
        writeAll(path, flipped);
        const auto crcLookup = cache.read(key);
        if (crcLookup.status != CacheStatus::Invalid || crcLookup.reason.find("checksum") == std::string::npos) {
            std::cerr << "Flipped payload byte must fail the checksum (" << crcLookup.reason << ")\n";
            return 1;
        }

        domain::CacheKey otherSymbol = key;
        otherSymbol.symbol = "ETHUSDT";
        fs::create_directories(cache.pathFor(otherSymbol).parent_path());
        writeAll(cache.pathFor(otherSymbol), pristine);
        if (cache.read(otherSymbol).status != CacheStatus::Invalid) {
            std::cerr << "File copied under another symbol must not be trusted\n";
            return 1;
        }

        // A valid rewrite replaces the damaged file.
        if (cache.write(key, bars).failed() || !cache.read(key).ok()) {
            std::cerr << "Rewrite should repair the cache entry\n";
            return 1;
        }
    }

    {
        TempDir dir;
        DailyBarCache cache({dir.path, std::chrono::hours(0), [now]() { return now; }});
        const auto bars = makeDay(day, domain::interval_from_label("1m"));
        domain::CacheKey minuteKey = key;
        minuteKey.interval = domain::interval_from_label("1m");

        std::atomic<int> failures{0};
        std::atomic<int> badReads{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&]() {
                for (int round = 0; round < 5; ++round) {
                    if (cache.write(minuteKey, bars).failed()) {
                        failures.fetch_add(1);
                    }
                    if (cache.read(minuteKey).status == CacheStatus::Invalid) {
                        badReads.fetch_add(1);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        if (failures.load() != 0 || badReads.load() != 0) {
            std::cerr << "Concurrent writers interfered (failures=" << failures.load()
                      << " badReads=" << badReads.load() << ")\n";
            return 1;
        }
        if (cache.read(minuteKey).bars.size() != 1440) {
            std::cerr << "Expected 1440 cached minute bars\n";
            return 1;
        }
    }

    {
        TempDir dir;
        DailyBarCache cache({dir.path, std::chrono::hours(0), [now]() { return now; }});
        domain::CacheKey weekly = key;
        weekly.interval = domain::interval_from_label("1w");
        if (!cache.write(weekly, {Bar{domain::utc_timestamp(2024, 3, 4), 1, 2, 0.5, 1.5, 1}}).failed()) {
            std::cerr << "Weekly bars are not cacheable\n";
            return 1;
        }
    }

    return 0;
}

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "domain/CacheKey.hpp"
#include "domain/DomainContracts.h"
#include "domain/Types.h"

namespace infra::storage {

enum class CacheStatus {
    Hit,
    Miss,
    Invalid,
};

struct CacheLookup {
    CacheStatus status{CacheStatus::Miss};
    std::vector<domain::Bar> bars;
    bool truncatedStart{false};
    std::string reason;

    bool ok() const noexcept { return status == CacheStatus::Hit; }
};

// Complete UTC days of bars, one immutable file per CacheKey. Files are
// replaced only through a temp file and rename, so concurrent readers see
// either the old or the new file.
class DailyBarCache {
public:
    using NowFn = std::function<domain::TimestampMs()>;

    struct Options {
        std::filesystem::path root;
        // Files older than this are rejected; zero disables the check.
        std::chrono::hours maxAge{24 * 30};
        NowFn now;
    };

    explicit DailyBarCache(Options options);

    std::filesystem::path pathFor(const domain::CacheKey& key) const;

    // Anything but a Hit (missing file, failed integrity check) is a miss for the caller.
    CacheLookup read(const domain::CacheKey& key) const;

    // Persists one complete day. Rejects partial days, bars that have not
    // closed yet and misaligned or unordered rows.
    domain::Result<std::size_t> write(const domain::CacheKey& key,
                                      const std::vector<domain::Bar>& bars,
                                      bool truncatedStart = false) const;

private:
    CacheLookup readFile_(const std::filesystem::path& path, const domain::CacheKey& key, bool checkAge) const;
    std::string validateDay_(const domain::CacheKey& key,
                             const std::vector<domain::Bar>& bars,
                             bool truncatedStart) const;
    std::filesystem::path tempPathFor_(const std::filesystem::path& finalPath) const;
    domain::TimestampMs now_() const;

    Options options_;
};

}  // namespace infra::storage

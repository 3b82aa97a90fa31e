#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>

namespace infra::storage {

// Day files are a fixed header followed by one contiguous block per column:
// openTime (int64) then open, high, low, close, volume (double), each
// rowCount entries long. Native little-endian layout, readable with mmap.
constexpr char kBarFileMagic[8] = {'K', 'F', 'C', 'P', 'B', 'A', 'R', '\0'};
constexpr std::uint32_t kBarFileVersion = 1;
constexpr std::uint32_t kBarFileColumns = 6;
constexpr std::uint32_t kFlagTruncatedStart = 0x1;
constexpr std::size_t kBytesPerRow = sizeof(std::int64_t) + 5 * sizeof(double);

struct BarFileHeader {
    char magic[8];
    std::uint32_t version;
    std::uint32_t columnCount;
    std::int64_t intervalMs;
    std::int64_t dayStart;
    std::uint64_t rowCount;
    std::uint32_t flags;
    std::uint32_t payloadCrc;
    char symbol[24];
    char interval[8];

    BarFileHeader() {
        std::memset(this, 0, sizeof(*this));
        std::memcpy(magic, kBarFileMagic, sizeof(magic));
        version = kBarFileVersion;
        columnCount = kBarFileColumns;
    }
};

static_assert(sizeof(BarFileHeader) == 80, "bar file header layout changed");
static_assert(std::is_trivially_copyable<BarFileHeader>::value, "bar file header must be trivially copyable");

}  // namespace infra::storage

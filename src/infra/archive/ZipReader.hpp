#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace infra::archive {

class ZipError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ZipEntry {
    std::string name;
    std::uint16_t method{0};
    std::uint32_t crc32{0};
    std::uint32_t compressedSize{0};
    std::uint32_t size{0};
    std::uint32_t localHeaderOffset{0};
};

// Reads an in-memory zip archive through its central directory. Supports
// stored and deflated entries; zip64 archives are rejected. The archive
// bytes must outlive the reader.
class ZipReader {
public:
    explicit ZipReader(std::string_view archive);

    const std::vector<ZipEntry>& entries() const noexcept { return entries_; }

    // Inflates the entry and checks its CRC-32.
    std::string extract(const ZipEntry& entry) const;

private:
    void readCentralDirectory_();

    std::string_view archive_;
    std::vector<ZipEntry> entries_;
};

}  // namespace infra::archive

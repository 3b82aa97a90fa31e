#include "infra/archive/ZipReader.hpp"

#include <zlib.h>

namespace infra::archive {
namespace {

constexpr std::uint32_t kEndOfCentralDirectory = 0x06054b50U;
constexpr std::uint32_t kCentralDirectoryEntry = 0x02014b50U;
constexpr std::uint32_t kLocalFileHeader = 0x04034b50U;
constexpr std::size_t kEndRecordSize = 22;
constexpr std::size_t kCentralEntrySize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;

std::uint16_t readU16(std::string_view data, std::size_t offset) {
    if (offset + 2 > data.size()) {
        throw ZipError("zip: truncated record");
    }
    return static_cast<std::uint16_t>(static_cast<unsigned char>(data[offset]) |
                                      (static_cast<unsigned char>(data[offset + 1]) << 8U));
}

std::uint32_t readU32(std::string_view data, std::size_t offset) {
    return static_cast<std::uint32_t>(readU16(data, offset)) |
           (static_cast<std::uint32_t>(readU16(data, offset + 2)) << 16U);
}

std::string inflateRaw(std::string_view compressed, std::size_t expectedSize) {
    if (expectedSize == 0) {
        return {};
    }
    std::string out(expectedSize, '\0');
    z_stream stream{};
    // Negative window bits: raw deflate data without a zlib header.
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        throw ZipError("zip: inflateInit2 failed");
    }
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());

    const int rc = inflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    inflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        throw ZipError("zip: inflate failed with code " + std::to_string(rc));
    }
    if (produced != expectedSize) {
        throw ZipError("zip: inflated size mismatch");
    }
    return out;
}

}  // namespace

ZipReader::ZipReader(std::string_view archive) : archive_(archive) { readCentralDirectory_(); }

void ZipReader::readCentralDirectory_() {
    if (archive_.size() < kEndRecordSize) {
        throw ZipError("zip: archive too small");
    }

    const std::size_t lowest = archive_.size() > kEndRecordSize + kMaxCommentSize
                                   ? archive_.size() - kEndRecordSize - kMaxCommentSize
                                   : 0;
    std::size_t endRecord = std::string_view::npos;
    for (std::size_t pos = archive_.size() - kEndRecordSize + 1; pos-- > lowest;) {
        if (readU32(archive_, pos) == kEndOfCentralDirectory) {
            endRecord = pos;
            break;
        }
    }
    if (endRecord == std::string_view::npos) {
        throw ZipError("zip: end of central directory not found");
    }

    const std::uint16_t count = readU16(archive_, endRecord + 10);
    const std::uint32_t directorySize = readU32(archive_, endRecord + 12);
    const std::uint32_t directoryOffset = readU32(archive_, endRecord + 16);
    if (count == 0xFFFFU || directoryOffset == 0xFFFFFFFFU) {
        throw ZipError("zip: zip64 archives are not supported");
    }
    if (static_cast<std::size_t>(directoryOffset) + directorySize > endRecord) {
        throw ZipError("zip: central directory out of bounds");
    }

    std::size_t pos = directoryOffset;
    entries_.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        if (readU32(archive_, pos) != kCentralDirectoryEntry) {
            throw ZipError("zip: bad central directory entry signature");
        }
        ZipEntry entry{};
        entry.method = readU16(archive_, pos + 10);
        entry.crc32 = readU32(archive_, pos + 16);
        entry.compressedSize = readU32(archive_, pos + 20);
        entry.size = readU32(archive_, pos + 24);
        const std::uint16_t nameLength = readU16(archive_, pos + 28);
        const std::uint16_t extraLength = readU16(archive_, pos + 30);
        const std::uint16_t commentLength = readU16(archive_, pos + 32);
        entry.localHeaderOffset = readU32(archive_, pos + 42);
        if (pos + kCentralEntrySize + nameLength > archive_.size()) {
            throw ZipError("zip: truncated entry name");
        }
        entry.name = std::string{archive_.substr(pos + kCentralEntrySize, nameLength)};
        entries_.push_back(std::move(entry));
        pos += kCentralEntrySize + nameLength + extraLength + commentLength;
    }
}

std::string ZipReader::extract(const ZipEntry& entry) const {
    const std::size_t header = entry.localHeaderOffset;
    if (readU32(archive_, header) != kLocalFileHeader) {
        throw ZipError("zip: bad local header for " + entry.name);
    }
    const std::size_t dataStart =
        header + kLocalHeaderSize + readU16(archive_, header + 26) + readU16(archive_, header + 28);
    if (dataStart + entry.compressedSize > archive_.size()) {
        throw ZipError("zip: entry data out of bounds for " + entry.name);
    }
    const auto compressed = archive_.substr(dataStart, entry.compressedSize);

    std::string data;
    switch (entry.method) {
    case kMethodStored:
        if (entry.compressedSize != entry.size) {
            throw ZipError("zip: stored entry size mismatch for " + entry.name);
        }
        data = std::string{compressed};
        break;
    case kMethodDeflate:
        data = inflateRaw(compressed, entry.size);
        break;
    default:
        throw ZipError("zip: unsupported compression method " + std::to_string(entry.method) + " for " +
                       entry.name);
    }

    const auto actual = static_cast<std::uint32_t>(
        ::crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
    if (actual != entry.crc32) {
        throw ZipError("zip: CRC mismatch for " + entry.name);
    }
    return data;
}

}  // namespace infra::archive

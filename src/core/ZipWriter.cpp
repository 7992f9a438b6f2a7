/**
 * @file ZipWriter.cpp
 * @brief Streaming zip archive writer with ZIP64 extensions
 */

#include "qrshare/ZipWriter.h"
#include "qrshare/config.h"
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <limits>

namespace QrShare {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50u;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50u;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50u;
constexpr uint32_t kZip64EndOfCentralDirSignature = 0x06064b50u;
constexpr uint32_t kZip64LocatorSignature = 0x07064b50u;
constexpr uint16_t kZip64ExtraId = 0x0001;

constexpr uint16_t kVersionNeeded = 20;                     // 2.0: deflate, directories
constexpr uint16_t kVersionNeededZip64 = 45;
constexpr uint16_t kVersionMadeBy = (3u << 8) | 45u;       // Unix host, PKWARE 4.5
constexpr uint16_t kFlagUtf8Names = 0x0800;                 // General purpose bit 11
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;

constexpr uint64_t kMax32 = std::numeric_limits<uint32_t>::max();
constexpr uint64_t kMax16 = std::numeric_limits<uint16_t>::max();

void putLe16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void putLe32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
}

void putLe64(std::string& out, uint64_t v) {
    putLe32(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
    putLe32(out, static_cast<uint32_t>(v >> 32));
}

// Classic 32-bit field value: the real value, or 0xFFFFFFFF when it lives in
// the ZIP64 extra
uint32_t field32(uint64_t v) {
    return v >= kMax32 ? static_cast<uint32_t>(kMax32) : static_cast<uint32_t>(v);
}

void toDosDateTime(std::time_t t, uint16_t& dosTime, uint16_t& dosDate) {
    std::tm tm{};
    localtime_r(&t, &tm);
    int year = tm.tm_year + 1900;
    if (year < 1980) {
        year = 1980;
        tm.tm_mon = 0;
        tm.tm_mday = 1;
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;
    }
    dosTime = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dosDate = static_cast<uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

std::string errnoText(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

ZipWriter::ZipWriter()
    : m_file(nullptr)
{
}

ZipWriter::~ZipWriter() {
    close();
}

void ZipWriter::close() {
    if (m_file) {
        std::fclose(m_file);
        m_file = nullptr;
    }
}

//=============================================================================
// ZipWriter: open()
//=============================================================================

bool ZipWriter::open(const std::filesystem::path& archivePath, std::string& errorMsg) {
    close();
    m_entries.clear();
    m_path = archivePath;

    m_file = std::fopen(archivePath.c_str(), "w+b");
    if (!m_file) {
        errorMsg = errnoText("Cannot create archive " + archivePath.string());
        return false;
    }
    return true;
}

//=============================================================================
// ZipWriter: entries
//=============================================================================

bool ZipWriter::beginEntry(CentralEntry& entry, std::string& errorMsg) {
    if (entry.name.empty() || entry.name.size() > kMax16) {
        errorMsg = "Invalid entry name length: " + entry.name;
        return false;
    }

    const off_t offset = ::ftello(m_file);
    if (offset < 0) {
        errorMsg = errnoText("ftello failed");
        return false;
    }
    entry.localHeaderOffset = static_cast<uint64_t>(offset);

    std::string header;
    putLe32(header, kLocalHeaderSignature);
    putLe16(header, entry.localZip64 ? kVersionNeededZip64 : kVersionNeeded);
    putLe16(header, kFlagUtf8Names);
    putLe16(header, entry.method);
    putLe16(header, entry.dosTime);
    putLe16(header, entry.dosDate);
    putLe32(header, 0);  // crc, patched later
    putLe32(header, entry.localZip64 ? static_cast<uint32_t>(kMax32) : 0);
    putLe32(header, entry.localZip64 ? static_cast<uint32_t>(kMax32) : 0);
    putLe16(header, static_cast<uint16_t>(entry.name.size()));
    putLe16(header, entry.localZip64 ? 20 : 0);  // extra field length
    header += entry.name;
    if (entry.localZip64) {
        // Sizes are patched after the data is written
        putLe16(header, kZip64ExtraId);
        putLe16(header, 16);
        putLe64(header, 0);
        putLe64(header, 0);
    }

    return writeBytes(header.data(), header.size(), errorMsg);
}

bool ZipWriter::addFile(const std::filesystem::path& source, const std::string& entryName,
                        std::string& errorMsg) {
    if (!m_file) {
        errorMsg = "Archive is not open";
        return false;
    }

    std::FILE* in = std::fopen(source.c_str(), "rb");
    if (!in) {
        errorMsg = errnoText("Cannot read " + source.string());
        return false;
    }

    struct stat st{};
    if (::fstat(::fileno(in), &st) != 0) {
        errorMsg = errnoText("Cannot stat " + source.string());
        std::fclose(in);
        return false;
    }

    CentralEntry entry;
    entry.name = entryName;
    entry.method = kMethodDeflated;
    entry.externalAttributes = static_cast<uint32_t>(st.st_mode & 0xFFFF) << 16;
    entry.localZip64 = static_cast<uint64_t>(st.st_size) >= kMax32;
    toDosDateTime(st.st_mtime, entry.dosTime, entry.dosDate);

    if (!beginEntry(entry, errorMsg)) {
        std::fclose(in);
        return false;
    }

    const off_t dataStart = ::ftello(m_file);
    uint64_t written = 0;
    bool ok = writeDeflated(in, entry, written, errorMsg);

    // Deflate did not help: rewrite the data stored
    if (ok && written >= entry.uncompressedSize) {
        ok = std::fflush(m_file) == 0 &&
             ::ftruncate(::fileno(m_file), dataStart) == 0 &&
             ::fseeko(m_file, dataStart, SEEK_SET) == 0;
        if (!ok) {
            errorMsg = errnoText("Cannot rewind archive");
        } else {
            std::rewind(in);
            entry.method = kMethodStored;
            written = 0;
            ok = writeStored(in, entry, written, errorMsg);
        }
    }
    std::fclose(in);

    if (!ok) {
        return false;
    }

    entry.compressedSize = written;
    if (!entry.localZip64 &&
        (entry.compressedSize >= kMax32 || entry.uncompressedSize >= kMax32)) {
        errorMsg = "File grew past 4 GiB while archiving: " + source.string();
        return false;
    }
    if (!patchLocalHeader(entry, errorMsg)) {
        return false;
    }

    m_entries.push_back(std::move(entry));
    return true;
}

bool ZipWriter::addDirectory(const std::string& entryName, std::string& errorMsg) {
    if (!m_file) {
        errorMsg = "Archive is not open";
        return false;
    }

    CentralEntry entry;
    entry.name = entryName;
    if (entry.name.empty() || entry.name.back() != '/') {
        entry.name.push_back('/');
    }
    entry.method = kMethodStored;
    entry.externalAttributes = (static_cast<uint32_t>(S_IFDIR | 0755) << 16) | 0x10;  // MS-DOS dir bit
    toDosDateTime(std::time(nullptr), entry.dosTime, entry.dosDate);

    if (!beginEntry(entry, errorMsg)) {
        return false;
    }
    m_entries.push_back(std::move(entry));
    return true;
}

bool ZipWriter::writeDeflated(std::FILE* source, CentralEntry& entry, uint64_t& written,
                              std::string& errorMsg) {
    z_stream zs{};
    // Negative window bits: raw deflate without zlib header, as zip expects
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        errorMsg = "deflateInit2 failed";
        return false;
    }

    std::vector<unsigned char> inBuf(BUFFER_SIZE);
    std::vector<unsigned char> outBuf(BUFFER_SIZE);
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t total = 0;
    bool ok = true;

    int flush = Z_NO_FLUSH;
    do {
        const size_t n = std::fread(inBuf.data(), 1, inBuf.size(), source);
        if (std::ferror(source)) {
            errorMsg = "Read error while compressing " + entry.name;
            ok = false;
            break;
        }
        total += n;
        crc = crc32(crc, inBuf.data(), static_cast<uInt>(n));
        flush = std::feof(source) ? Z_FINISH : Z_NO_FLUSH;

        zs.next_in = inBuf.data();
        zs.avail_in = static_cast<uInt>(n);
        do {
            zs.next_out = outBuf.data();
            zs.avail_out = static_cast<uInt>(outBuf.size());
            if (deflate(&zs, flush) == Z_STREAM_ERROR) {
                errorMsg = "deflate failed for " + entry.name;
                ok = false;
                break;
            }
            const size_t have = outBuf.size() - zs.avail_out;
            if (!writeBytes(outBuf.data(), have, errorMsg)) {
                ok = false;
                break;
            }
            written += have;
        } while (zs.avail_out == 0);
    } while (ok && flush != Z_FINISH);

    deflateEnd(&zs);

    if (!ok) {
        return false;
    }

    entry.crc = static_cast<uint32_t>(crc);
    entry.uncompressedSize = total;
    return true;
}

bool ZipWriter::writeStored(std::FILE* source, CentralEntry& entry, uint64_t& written,
                            std::string& errorMsg) {
    std::vector<unsigned char> buf(BUFFER_SIZE);
    uLong crc = crc32(0L, Z_NULL, 0);

    while (true) {
        const size_t n = std::fread(buf.data(), 1, buf.size(), source);
        if (std::ferror(source)) {
            errorMsg = "Read error while storing " + entry.name;
            return false;
        }
        if (n == 0) {
            break;
        }
        written += n;
        crc = crc32(crc, buf.data(), static_cast<uInt>(n));
        if (!writeBytes(buf.data(), n, errorMsg)) {
            return false;
        }
    }

    entry.crc = static_cast<uint32_t>(crc);
    entry.uncompressedSize = written;
    return true;
}

bool ZipWriter::patchLocalHeader(const CentralEntry& entry, std::string& errorMsg) {
    const off_t end = ::ftello(m_file);
    if (end < 0) {
        errorMsg = errnoText("ftello failed");
        return false;
    }

    // method .. uncompressed size live at offset 8 of the local header
    std::string patch;
    putLe16(patch, entry.method);
    putLe16(patch, entry.dosTime);
    putLe16(patch, entry.dosDate);
    putLe32(patch, entry.crc);
    putLe32(patch, entry.localZip64 ? static_cast<uint32_t>(kMax32)
                                    : static_cast<uint32_t>(entry.compressedSize));
    putLe32(patch, entry.localZip64 ? static_cast<uint32_t>(kMax32)
                                    : static_cast<uint32_t>(entry.uncompressedSize));

    const off_t headerStart = static_cast<off_t>(entry.localHeaderOffset);
    if (::fseeko(m_file, headerStart + 8, SEEK_SET) != 0) {
        errorMsg = errnoText("Cannot seek in archive");
        return false;
    }
    if (!writeBytes(patch.data(), patch.size(), errorMsg)) {
        return false;
    }

    if (entry.localZip64) {
        // Extra data follows the 30-byte header and the name; skip its id and size
        std::string sizes;
        putLe64(sizes, entry.uncompressedSize);
        putLe64(sizes, entry.compressedSize);
        const off_t extraData = headerStart + 30 + static_cast<off_t>(entry.name.size()) + 4;
        if (::fseeko(m_file, extraData, SEEK_SET) != 0) {
            errorMsg = errnoText("Cannot seek in archive");
            return false;
        }
        if (!writeBytes(sizes.data(), sizes.size(), errorMsg)) {
            return false;
        }
    }
    if (::fseeko(m_file, end, SEEK_SET) != 0) {
        errorMsg = errnoText("Cannot seek in archive");
        return false;
    }
    return true;
}

bool ZipWriter::writeBytes(const void* data, size_t size, std::string& errorMsg) {
    if (size == 0) {
        return true;
    }
    if (std::fwrite(data, 1, size, m_file) != size) {
        errorMsg = errnoText("Cannot write archive " + m_path.string());
        return false;
    }
    return true;
}

//=============================================================================
// ZipWriter: finish()
//=============================================================================

bool ZipWriter::finish(std::string& errorMsg) {
    if (!m_file) {
        errorMsg = "Archive is not open";
        return false;
    }

    const off_t cdStart = ::ftello(m_file);
    if (cdStart < 0) {
        errorMsg = errnoText("ftello failed");
        return false;
    }

    uint64_t cdSize = 0;
    for (const auto& e : m_entries) {
        // ZIP64 extra fields appear in this fixed order, each only when needed
        std::string extra;
        if (e.uncompressedSize >= kMax32) {
            putLe64(extra, e.uncompressedSize);
        }
        if (e.compressedSize >= kMax32) {
            putLe64(extra, e.compressedSize);
        }
        if (e.localHeaderOffset >= kMax32) {
            putLe64(extra, e.localHeaderOffset);
        }
        const bool zip64 = !extra.empty() || e.localZip64;

        std::string rec;
        putLe32(rec, kCentralHeaderSignature);
        putLe16(rec, kVersionMadeBy);
        putLe16(rec, zip64 ? kVersionNeededZip64 : kVersionNeeded);
        putLe16(rec, kFlagUtf8Names);
        putLe16(rec, e.method);
        putLe16(rec, e.dosTime);
        putLe16(rec, e.dosDate);
        putLe32(rec, e.crc);
        putLe32(rec, field32(e.compressedSize));
        putLe32(rec, field32(e.uncompressedSize));
        putLe16(rec, static_cast<uint16_t>(e.name.size()));
        putLe16(rec, static_cast<uint16_t>(extra.empty() ? 0 : extra.size() + 4));
        putLe16(rec, 0);  // comment length
        putLe16(rec, 0);  // disk number start
        putLe16(rec, 0);  // internal attributes
        putLe32(rec, e.externalAttributes);
        putLe32(rec, field32(e.localHeaderOffset));
        rec += e.name;
        if (!extra.empty()) {
            putLe16(rec, kZip64ExtraId);
            putLe16(rec, static_cast<uint16_t>(extra.size()));
            rec += extra;
        }

        if (!writeBytes(rec.data(), rec.size(), errorMsg)) {
            return false;
        }
        cdSize += rec.size();
    }

    if (!writeEndOfCentralDirectory(static_cast<uint64_t>(cdStart), cdSize, errorMsg)) {
        return false;
    }

    const int rc = std::fclose(m_file);
    m_file = nullptr;
    if (rc != 0) {
        errorMsg = errnoText("Cannot finalize archive " + m_path.string());
        return false;
    }
    return true;
}

bool ZipWriter::writeEndOfCentralDirectory(uint64_t cdStart, uint64_t cdSize,
                                           std::string& errorMsg) {
    const uint64_t count = m_entries.size();
    const bool zip64 = count >= kMax16 || cdSize >= kMax32 || cdStart >= kMax32;

    std::string tail;
    if (zip64) {
        const uint64_t zip64EocdOffset = cdStart + cdSize;

        putLe32(tail, kZip64EndOfCentralDirSignature);
        putLe64(tail, 44);  // size of the remaining record
        putLe16(tail, kVersionMadeBy);
        putLe16(tail, kVersionNeededZip64);
        putLe32(tail, 0);   // this disk
        putLe32(tail, 0);   // disk with the central directory
        putLe64(tail, count);
        putLe64(tail, count);
        putLe64(tail, cdSize);
        putLe64(tail, cdStart);

        putLe32(tail, kZip64LocatorSignature);
        putLe32(tail, 0);   // disk with the ZIP64 end record
        putLe64(tail, zip64EocdOffset);
        putLe32(tail, 1);   // total disks
    }

    const uint16_t count16 = count >= kMax16 ? static_cast<uint16_t>(kMax16)
                                             : static_cast<uint16_t>(count);
    putLe32(tail, kEndOfCentralDirSignature);
    putLe16(tail, 0);
    putLe16(tail, 0);
    putLe16(tail, count16);
    putLe16(tail, count16);
    putLe32(tail, field32(cdSize));
    putLe32(tail, field32(cdStart));
    putLe16(tail, 0);  // comment length

    return writeBytes(tail.data(), tail.size(), errorMsg);
}

}  // namespace QrShare

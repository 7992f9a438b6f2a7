/**
 * @file ZipWriter.h
 * @brief Streaming zip archive writer with ZIP64 extensions
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

namespace QrShare {

/**
 * @class ZipWriter
 * @brief Writes a zip archive entry by entry without holding file contents in memory
 *
 * Each file is raw-deflated (zlib) in BUFFER_SIZE chunks. When deflate does
 * not shrink an entry it is rewritten with method 0 (stored). Sizes and CRC
 * are patched into the local header after the data is written, so no data
 * descriptors are used.
 *
 * ZIP64 records are written only where a value overflows the classic
 * fields: a local ZIP64 extra for files whose size is 4 GiB or more, central
 * ZIP64 extras for large sizes or offsets, and the ZIP64 end of central
 * directory record plus locator for 65535 entries or more, or a central
 * directory beyond 4 GiB. Small archives stay plain zip 2.0.
 *
 * Usage:
 * @code
 * ZipWriter zip;
 * std::string error;
 * if (zip.open(path, error) &&
 *     zip.addFile("/data/a.txt", "a.txt", error) &&
 *     zip.finish(error)) {
 *     // archive complete
 * }
 * @endcode
 */
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief Create (or truncate) the archive file
     */
    bool open(const std::filesystem::path& archivePath, std::string& errorMsg);

    /**
     * @brief Append a regular file
     * @param source File to read
     * @param entryName Name inside the archive ('/' separated, relative)
     */
    bool addFile(const std::filesystem::path& source, const std::string& entryName,
                 std::string& errorMsg);

    /**
     * @brief Append a directory entry ("name/")
     */
    bool addDirectory(const std::string& entryName, std::string& errorMsg);

    /**
     * @brief Write the central directory and close the file
     */
    bool finish(std::string& errorMsg);

    size_t getEntryCount() const { return m_entries.size(); }

private:
    struct CentralEntry {
        std::string name;
        uint16_t method = 0;
        uint16_t dosTime = 0;
        uint16_t dosDate = 0;
        uint32_t crc = 0;
        uint64_t compressedSize = 0;
        uint64_t uncompressedSize = 0;
        uint64_t localHeaderOffset = 0;
        uint32_t externalAttributes = 0;
        bool localZip64 = false;   ///< Local header carries a ZIP64 extra
    };

    bool beginEntry(CentralEntry& entry, std::string& errorMsg);
    bool writeDeflated(std::FILE* source, CentralEntry& entry, uint64_t& written,
                       std::string& errorMsg);
    bool writeStored(std::FILE* source, CentralEntry& entry, uint64_t& written,
                     std::string& errorMsg);
    bool patchLocalHeader(const CentralEntry& entry, std::string& errorMsg);
    bool writeEndOfCentralDirectory(uint64_t cdStart, uint64_t cdSize, std::string& errorMsg);
    bool writeBytes(const void* data, size_t size, std::string& errorMsg);
    void close();

    std::FILE* m_file;
    std::filesystem::path m_path;
    std::vector<CentralEntry> m_entries;
};

}  // namespace QrShare

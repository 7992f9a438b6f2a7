/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "qrshare/AtomicFile.h"

#include <fstream>

namespace QrShare {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool atomicReplace(const std::filesystem::path& tempPath,
                   const std::filesystem::path& finalPath,
                   std::string& errorMsg)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist";
        return false;
    }

    // rename(2) replaces an existing target atomically on POSIX.
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }

    return true;
}

bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const std::string& content,
                     std::string& errorMsg)
{
    errorMsg.clear();

    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);
    std::error_code ec;

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Failed to open temp file: " + paths.tempPath.string();
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            errorMsg = "Failed to write temp file: " + paths.tempPath.string();
            return false;
        }
    }

    if (!atomicReplace(paths.tempPath, paths.finalPath, errorMsg)) {
        std::filesystem::remove(paths.tempPath, ec);
        return false;
    }

    return true;
}

}  // namespace QrShare

/**
 * @file AtomicFile.h
 * @brief Small helpers for atomic file writes (write temp, then rename).
 */

#pragma once

#include <filesystem>
#include <string>

namespace QrShare {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute a temp path next to finalPath for atomic writes.
 *
 * The temp path is derived deterministically from finalPath so callers can
 * clean up partial files on error.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Atomically replace finalPath with tempPath using rename semantics.
 *
 * tempPath must exist as a file. An existing finalPath is replaced; readers
 * observe either the old or the new content, never a partial file.
 */
bool atomicReplace(const std::filesystem::path& tempPath,
                   const std::filesystem::path& finalPath,
                   std::string& errorMsg);

/**
 * @brief Write content to finalPath atomically (temp file + atomicReplace).
 *
 * The temp file is removed if any step fails.
 */
bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const std::string& content,
                     std::string& errorMsg);

}  // namespace QrShare

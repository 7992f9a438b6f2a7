/**
 * @file ArchiveBuilder.h
 * @brief Turns the paths given on the command line into one servable file
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace QrShare {

/**
 * @brief The file to serve and whether it must be deleted afterwards
 */
struct ArchiveResult {
    std::filesystem::path path;
    bool isTemporary = false;
};

/**
 * @class ArchiveBuilder
 * @brief Packs input paths into a temporary zip archive when needed
 *
 * Rules:
 * - One regular file and no forceZip: the path is returned unchanged and
 *   isTemporary is false.
 * - Otherwise a new archive "qrshare-XXXXXX.zip" is created in the system
 *   temporary directory. A directory input contributes every file below it,
 *   named relative to the directory's parent ("dir/b/c.txt"); a file input is
 *   stored under its base name.
 *
 * A partially written archive is removed before build() returns false.
 */
class ArchiveBuilder {
public:
    /**
     * @brief Check that every input exists and is a file or directory
     * @return false with a message naming the first bad path
     */
    static bool validateInputs(const std::vector<std::filesystem::path>& paths,
                               std::string& errorMsg);

    /**
     * @brief Produce the artifact for a set of input paths
     * @param paths Files and/or directories (at least one)
     * @param forceZip Pack even a single file
     * @param result Output artifact
     * @param errorMsg Output error message
     * @return true on success
     */
    static bool build(const std::vector<std::filesystem::path>& paths,
                      bool forceZip,
                      ArchiveResult& result,
                      std::string& errorMsg);

    /**
     * @brief Archive entry name for a file found below a directory input
     *
     * The name is relative to the parent of the directory input and uses '/'.
     */
    static std::string entryNameFor(const std::filesystem::path& inputDir,
                                    const std::filesystem::path& file);

private:
    static bool createTempArchive(std::filesystem::path& out, std::string& errorMsg);
};

}  // namespace QrShare

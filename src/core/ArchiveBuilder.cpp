/**
 * @file ArchiveBuilder.cpp
 * @brief Turns the paths given on the command line into one servable file
 */

#include "qrshare/ArchiveBuilder.h"
#include "qrshare/ZipWriter.h"
#include "qrshare/Debug.h"
#include <stdlib.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>

namespace fs = std::filesystem;

namespace QrShare {

namespace {

fs::path normalizedInput(const fs::path& input) {
    fs::path abs = fs::absolute(input).lexically_normal();
    // "dir/" normalizes to "dir/" with an empty filename
    if (abs.filename().empty() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

} // anonymous namespace

//=============================================================================
// ArchiveBuilder: validateInputs()
//=============================================================================

bool ArchiveBuilder::validateInputs(const std::vector<fs::path>& paths, std::string& errorMsg) {
    if (paths.empty()) {
        errorMsg = "No input paths given";
        return false;
    }

    for (const auto& p : paths) {
        std::error_code ec;
        const fs::file_status st = fs::status(p, ec);
        if (ec || !fs::exists(st)) {
            errorMsg = "Path does not exist: " + p.string();
            return false;
        }
        if (!fs::is_regular_file(st) && !fs::is_directory(st)) {
            errorMsg = "Not a regular file or directory: " + p.string();
            return false;
        }
        if (::access(p.c_str(), R_OK) != 0) {
            errorMsg = "Path is not readable: " + p.string();
            return false;
        }
    }
    return true;
}

//=============================================================================
// ArchiveBuilder: entryNameFor()
//=============================================================================

std::string ArchiveBuilder::entryNameFor(const fs::path& inputDir, const fs::path& file) {
    const fs::path dir = normalizedInput(inputDir);
    const fs::path root = dir.parent_path();
    return normalizedInput(file).lexically_relative(root).generic_string();
}

//=============================================================================
// ArchiveBuilder: build()
//=============================================================================

bool ArchiveBuilder::build(const std::vector<fs::path>& paths,
                           bool forceZip,
                           ArchiveResult& result,
                           std::string& errorMsg) {
    if (!validateInputs(paths, errorMsg)) {
        return false;
    }

    if (paths.size() == 1 && !forceZip && fs::is_regular_file(paths.front())) {
        result.path = paths.front();
        result.isTemporary = false;
        return true;
    }

    fs::path archivePath;
    if (!createTempArchive(archivePath, errorMsg)) {
        return false;
    }

    auto fail = [&archivePath]() {
        std::error_code ec;
        fs::remove(archivePath, ec);
        return false;
    };

    ZipWriter zip;
    if (!zip.open(archivePath, errorMsg)) {
        return fail();
    }

    std::set<std::string> seen;
    auto addUnique = [&seen](const std::string& name) {
        if (!seen.insert(name).second) {
            LOG_WARNING("[ArchiveBuilder] Duplicate entry skipped: " << name);
            return false;
        }
        return true;
    };

    for (const auto& input : paths) {
        if (!fs::is_directory(input)) {
            const std::string name = normalizedInput(input).filename().string();
            if (addUnique(name) && !zip.addFile(input, name, errorMsg)) {
                return fail();
            }
            continue;
        }

        // Collect and sort so archives are reproducible
        std::vector<fs::path> files;
        std::vector<fs::path> dirs;
        std::error_code ec;
        fs::recursive_directory_iterator it(input, ec);
        if (ec) {
            errorMsg = "Cannot read directory " + input.string() + ": " + ec.message();
            return fail();
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                errorMsg = "Cannot read directory " + input.string() + ": " + ec.message();
                return fail();
            }
            if (it->is_directory(ec)) {
                dirs.push_back(it->path());
            } else if (it->is_regular_file(ec)) {
                files.push_back(it->path());
            }
        }
        if (ec) {
            errorMsg = "Cannot read directory " + input.string() + ": " + ec.message();
            return fail();
        }
        std::sort(files.begin(), files.end());
        std::sort(dirs.begin(), dirs.end());

        // Only empty directories need their own entry
        for (const auto& d : dirs) {
            if (fs::is_empty(d, ec) && !ec) {
                const std::string name = entryNameFor(input, d) + "/";
                if (addUnique(name) && !zip.addDirectory(name, errorMsg)) {
                    return fail();
                }
            }
        }
        for (const auto& f : files) {
            const std::string name = entryNameFor(input, f);
            if (addUnique(name) && !zip.addFile(f, name, errorMsg)) {
                return fail();
            }
        }
    }

    if (!zip.finish(errorMsg)) {
        return fail();
    }

    LOG_DEBUG("[ArchiveBuilder] Packed " << zip.getEntryCount() << " entries into "
              << archivePath.string());

    result.path = archivePath;
    result.isTemporary = true;
    return true;
}

bool ArchiveBuilder::createTempArchive(fs::path& out, std::string& errorMsg) {
    std::error_code ec;
    const fs::path tmpDir = fs::temp_directory_path(ec);
    if (ec) {
        errorMsg = "No temporary directory: " + ec.message();
        return false;
    }

    std::string pattern = (tmpDir / "qrshare-XXXXXX.zip").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), 4);
    if (fd < 0) {
        errorMsg = std::string("Cannot create temporary archive: ") + std::strerror(errno);
        return false;
    }
    ::close(fd);

    out = fs::path(buf.data());
    return true;
}

}  // namespace QrShare

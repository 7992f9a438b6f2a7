/**
 * @file AppPaths.cpp
 * @brief Canonical storage paths for QrShare.
 */

#include "qrshare/AppPaths.h"
#include "qrshare/config.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace QrShare {

std::filesystem::path AppPaths::homeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home);
    }

    const struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir && *pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir);
    }
    return {};
}

std::filesystem::path AppPaths::configJsonPath() {
    const char* overridePath = std::getenv(USER_CONFIG_ENV);
    if (overridePath && *overridePath) {
        return std::filesystem::path(overridePath);
    }

    const auto home = homeDir();
    if (home.empty()) {
        return {};
    }
    return home / USER_CONFIG_FILE;
}

}  // namespace QrShare

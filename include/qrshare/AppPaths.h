/**
 * @file AppPaths.h
 * @brief Canonical storage paths for QrShare.
 *
 * Path contract:
 * - Config: $HOME/.qrshare.json
 *
 * The QRSHARE_CONFIG environment variable overrides the config path
 * (used by tests and by users who keep dotfiles elsewhere).
 */

#pragma once

#include <filesystem>

namespace QrShare {

class AppPaths {
public:
    /**
     * @brief Returns $HOME, or the passwd entry's home directory, or an empty path.
     */
    static std::filesystem::path homeDir();

    /**
     * @brief Returns the user config path.
     * @return $QRSHARE_CONFIG if set and non-empty, else $HOME/.qrshare.json,
     *         else an empty path when no home directory can be determined.
     */
    static std::filesystem::path configJsonPath();
};

}  // namespace QrShare

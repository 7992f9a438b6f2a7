/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace QrShare {
namespace ErrorCodes {

// Setup (fatal, reported before any server starts serving)
inline constexpr const char* SETUP_INVALID_PATH = "QRS-SETUP-1000";
inline constexpr const char* SETUP_ARCHIVE_FAILED = "QRS-SETUP-1001";
inline constexpr const char* SETUP_NO_ADDRESS = "QRS-SETUP-1100";
inline constexpr const char* SETUP_NO_FREE_PORT = "QRS-SETUP-1101";
inline constexpr const char* SETUP_SERVER_START_FAILED = "QRS-SETUP-1200";
inline constexpr const char* SETUP_TOKEN_FAILED = "QRS-SETUP-1300";

// Command line
inline constexpr const char* ARGS_INVALID = "QRS-ARGS-1000";

// Persisted configuration (warnings only)
inline constexpr const char* CONFIG_WRITE_FAILED = "QRS-CONFIG-1000";

}  // namespace ErrorCodes
}  // namespace QrShare

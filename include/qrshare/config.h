/**
 * @file config.h
 * @brief Configuration constants for QrShare
 *
 * This file contains the compile-time configuration constants used throughout
 * QrShare: network defaults, timeouts, buffer sizes, HTTP protocol names and
 * persisted configuration locations.
 *
 * @note The HTTP names below (query parameter, password header) are part of
 *       the URL contract shown to users. Changing them breaks shared links.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>

/**
 * @namespace QrShare
 * @brief QrShare namespace containing all public APIs
 */
namespace QrShare {

//=========================================================================
// Network
//=========================================================================

/** @defgroup Network Network Configuration
 * @{
 */

/**
 * @brief Address the download server binds to by default (all interfaces).
 */
constexpr const char* BIND_ADDRESS_ANY = "0.0.0.0";

/**
 * @brief Port value asking the OS for a free ephemeral port.
 *
 * DownloadServer binds to any free port when no explicit port is supplied
 * and reports the one it got.
 */
constexpr uint16_t PORT_ANY = 0;

/**
 * @brief Public address used to let the kernel pick the outbound interface.
 *
 * No packet is sent: a UDP socket is "connected" and getsockname() reports
 * the local address the routing table selected.
 */
constexpr const char* DEFAULT_ROUTE_TARGET_ADDRESS = "8.8.8.8";
constexpr uint16_t DEFAULT_ROUTE_TARGET_PORT = 80;

constexpr const char* LOCALHOST_IP = "127.0.0.1";

/** @} */ // end of Network

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @{
 */

/**
 * @brief Read timeout for a client's request.
 */
constexpr time_t REQUEST_READ_TIMEOUT_SEC = 15;

/**
 * @brief How long a connection may sit idle before its request line arrives.
 *
 * Also bounds how long stop() waits for a client that connected but never
 * sent anything.
 */
constexpr time_t IDLE_CONNECTION_TIMEOUT_SEC = 5;

/**
 * @brief Write timeout while streaming the artifact to a stalled client.
 */
constexpr time_t RESPONSE_WRITE_TIMEOUT_SEC = 10;

/** @} */ // end of Timing

//=========================================================================
// Buffers and Limits
//=========================================================================

/** @defgroup Limits Buffers and Limits
 * @{
 */

/**
 * @brief Chunk size used when streaming the artifact and building archives.
 */
constexpr size_t BUFFER_SIZE = 65536;  // 64 KB

/**
 * @brief Worker threads of the download server.
 *
 * Each connection occupies one worker; further connections wait in the
 * server's queue until a worker is free.
 */
constexpr size_t SERVER_THREAD_COUNT = 64;

/**
 * @brief Number of random bytes in a share token.
 *
 * 8 bytes encode to 11 URL-safe Base64 characters.
 */
constexpr size_t TOKEN_BYTES = 8;

/** @} */ // end of Limits

//=========================================================================
// HTTP Protocol Names
//=========================================================================

/** @defgroup Http HTTP Protocol Names
 * @{
 */

constexpr const char* PASSWORD_QUERY_PARAM = "passed";
constexpr const char* PASSWORD_HEADER = "X-Password";
constexpr const char* SERVER_NAME = "QrShare/1.0";

/** @} */ // end of Http

//=========================================================================
// Persisted Configuration
//=========================================================================

/** @defgroup Persisted Persisted Configuration
 * @{
 */

/**
 * @brief File name of the user configuration (under $HOME).
 */
constexpr const char* USER_CONFIG_FILE = ".qrshare.json";

/**
 * @brief Environment variable overriding the user configuration path.
 */
constexpr const char* USER_CONFIG_ENV = "QRSHARE_CONFIG";

constexpr const char* CONFIG_KEY_INTERFACE = "interface";

/** @} */ // end of Persisted

}  // namespace QrShare

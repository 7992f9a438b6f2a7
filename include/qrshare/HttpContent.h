/**
 * @file HttpContent.h
 * @brief URL encoding and content headers for the served artifact
 */

#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace QrShare {

/**
 * @brief Encode everything except RFC 3986 unreserved characters
 */
std::string percentEncode(const std::string& in);

/**
 * @brief MIME type guessed from the file extension
 */
std::string guessContentType(const std::filesystem::path& path);

/**
 * @brief Content-Disposition value that makes browsers save the artifact
 *
 * Printable ASCII names are sent quoted. Other names fall back to a generic
 * quoted name plus the RFC 6266 filename* form.
 */
std::string contentDisposition(const std::filesystem::path& artifact);

/**
 * @brief RFC 7231 IMF-fixdate ("Sun, 06 Nov 1994 08:49:37 GMT")
 */
std::string formatHttpDate(std::time_t t);

}  // namespace QrShare

/**
 * @file ShareToken.h
 * @brief Random share token helper (generation + URL-safe Base64 encoding).
 *
 * The token is the path component of the share URL. It is generated once per
 * session from a CSPRNG and never persisted.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace QrShare {

class ShareToken {
public:
    /**
     * @brief Generate a token from TOKEN_BYTES of CSPRNG output.
     * @param out Output token (URL-safe Base64, no padding).
     * @param errorMsg Output error message on failure.
     * @return true on success.
     */
    static bool generate(std::string& out, std::string& errorMsg);

    /**
     * @brief Encode bytes as unpadded URL-safe Base64 (RFC 4648 section 5).
     */
    static std::string toBase64Url(const std::vector<uint8_t>& bytes);

    /**
     * @brief True if s is non-empty and only uses the URL-safe Base64 alphabet.
     */
    static bool isValidToken(const std::string& s);
};

}  // namespace QrShare

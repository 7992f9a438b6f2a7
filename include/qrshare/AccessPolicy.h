/**
 * @file AccessPolicy.h
 * @brief Access decision for download requests (expiry, password, token).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace QrShare {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Outcome of evaluating one request against the session rules
 */
enum class AccessDecision : uint8_t {
    ALLOWED,              ///< Serve the artifact
    DENIED_EXPIRED,       ///< Link past its expiry deadline (410)
    DENIED_UNAUTHORIZED,  ///< Password required and not matched (401)
    DENIED_NOT_FOUND      ///< Token mismatch, reported as a plain 404
};

/**
 * @brief Convert AccessDecision to string
 */
inline std::string accessDecisionToString(AccessDecision decision) {
    switch (decision) {
        case AccessDecision::ALLOWED:             return "Allowed";
        case AccessDecision::DENIED_EXPIRED:      return "DeniedExpired";
        case AccessDecision::DENIED_UNAUTHORIZED: return "DeniedUnauthorized";
        case AccessDecision::DENIED_NOT_FOUND:    return "DeniedNotFound";
        default:                                  return "Unknown";
    }
}

/**
 * @brief Immutable per-session rules
 *
 * An unset or empty expectedPassword means no password is required.
 * An unset expiryDeadline means the link never expires.
 */
struct AccessRules {
    std::string expectedToken;
    std::optional<std::string> expectedPassword;
    std::optional<TimePoint> expiryDeadline;
};

/**
 * @brief What a single request presented
 *
 * Empty password strings mean "not provided".
 */
struct AccessCredentials {
    std::string token;           ///< Path component after the leading '/'
    std::string queryPassword;   ///< Value of the ?passed= query parameter
    std::string headerPassword;  ///< Value of the X-Password header
};

/**
 * @brief Decide whether a request may download the artifact.
 *
 * Evaluation order is fixed:
 * 1. Expired (now > deadline) -> DENIED_EXPIRED, whatever the credentials.
 * 2. Password configured and neither channel matches -> DENIED_UNAUTHORIZED.
 *    Query and header are alternatives; one match is enough.
 * 3. Token mismatch -> DENIED_NOT_FOUND.
 * 4. Otherwise ALLOWED.
 *
 * The password check runs before the token check so a client guessing
 * tokens without the password learns nothing about token validity.
 */
AccessDecision decideAccess(TimePoint now,
                            const AccessRules& rules,
                            const AccessCredentials& credentials);

/**
 * @brief Compare two secrets without a content-dependent early exit.
 *
 * Lengths are compared first (length is not treated as secret).
 */
bool secretEquals(const std::string& presented, const std::string& expected);

/**
 * @brief HTTP status code for a decision (200, 410, 401, 404)
 */
int httpStatusForDecision(AccessDecision decision);

}  // namespace QrShare

/**
 * @file AccessPolicy.cpp
 * @brief Access decision implementation.
 */

#include "qrshare/AccessPolicy.h"

#include <openssl/crypto.h>

namespace QrShare {

bool secretEquals(const std::string& presented, const std::string& expected)
{
    if (presented.size() != expected.size()) {
        return false;
    }
    if (expected.empty()) {
        return true;
    }
    return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

AccessDecision decideAccess(TimePoint now,
                            const AccessRules& rules,
                            const AccessCredentials& credentials)
{
    if (rules.expiryDeadline && now > *rules.expiryDeadline) {
        return AccessDecision::DENIED_EXPIRED;
    }

    if (rules.expectedPassword && !rules.expectedPassword->empty()) {
        const std::string& expected = *rules.expectedPassword;

        // Evaluate both channels so timing does not reveal which one matched.
        const bool queryMatch = !credentials.queryPassword.empty() &&
                                secretEquals(credentials.queryPassword, expected);
        const bool headerMatch = !credentials.headerPassword.empty() &&
                                 secretEquals(credentials.headerPassword, expected);
        if (!queryMatch && !headerMatch) {
            return AccessDecision::DENIED_UNAUTHORIZED;
        }
    }

    if (rules.expectedToken.empty() ||
        !secretEquals(credentials.token, rules.expectedToken)) {
        return AccessDecision::DENIED_NOT_FOUND;
    }

    return AccessDecision::ALLOWED;
}

int httpStatusForDecision(AccessDecision decision)
{
    switch (decision) {
        case AccessDecision::ALLOWED:             return 200;
        case AccessDecision::DENIED_EXPIRED:      return 410;
        case AccessDecision::DENIED_UNAUTHORIZED: return 401;
        case AccessDecision::DENIED_NOT_FOUND:    return 404;
    }
    return 404;
}

}  // namespace QrShare

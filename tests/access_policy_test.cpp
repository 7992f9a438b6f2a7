#include <gtest/gtest.h>
#include "qrshare/AccessPolicy.h"

using namespace QrShare;

namespace {

AccessRules rulesFor(const std::string& token) {
    AccessRules rules;
    rules.expectedToken = token;
    return rules;
}

AccessCredentials creds(const std::string& token,
                        const std::string& queryPassword = "",
                        const std::string& headerPassword = "") {
    AccessCredentials c;
    c.token = token;
    c.queryPassword = queryPassword;
    c.headerPassword = headerPassword;
    return c;
}

}  // namespace

TEST(AccessPolicyTest, CorrectTokenWithoutPasswordOrExpiryIsAllowed) {
    EXPECT_EQ(decideAccess(Clock::now(), rulesFor("abc123"), creds("abc123")),
              AccessDecision::ALLOWED);
}

TEST(AccessPolicyTest, WrongTokenIsNotFound) {
    EXPECT_EQ(decideAccess(Clock::now(), rulesFor("abc123"), creds("wrong")),
              AccessDecision::DENIED_NOT_FOUND);
    EXPECT_EQ(decideAccess(Clock::now(), rulesFor("abc123"), creds("")),
              AccessDecision::DENIED_NOT_FOUND);
    EXPECT_EQ(decideAccess(Clock::now(), rulesFor("abc123"), creds("abc1234")),
              AccessDecision::DENIED_NOT_FOUND);
}

TEST(AccessPolicyTest, EmptyExpectedTokenNeverMatches) {
    EXPECT_EQ(decideAccess(Clock::now(), rulesFor(""), creds("")),
              AccessDecision::DENIED_NOT_FOUND);
}

TEST(AccessPolicyTest, ExpiredBeatsValidCredentials) {
    const TimePoint now = Clock::now();
    AccessRules rules = rulesFor("abc123");
    rules.expectedPassword = "secret";
    rules.expiryDeadline = now - std::chrono::seconds(1);

    EXPECT_EQ(decideAccess(now, rules, creds("abc123", "secret")),
              AccessDecision::DENIED_EXPIRED);
    EXPECT_EQ(decideAccess(now, rules, creds("wrong")),
              AccessDecision::DENIED_EXPIRED);
}

TEST(AccessPolicyTest, DeadlineItselfIsStillValid) {
    const TimePoint now = Clock::now();
    AccessRules rules = rulesFor("abc123");
    rules.expiryDeadline = now;

    EXPECT_EQ(decideAccess(now, rules, creds("abc123")), AccessDecision::ALLOWED);
    EXPECT_EQ(decideAccess(now + std::chrono::milliseconds(1), rules, creds("abc123")),
              AccessDecision::DENIED_EXPIRED);
}

TEST(AccessPolicyTest, PasswordViaQueryOrHeaderIsAllowed) {
    AccessRules rules = rulesFor("abc123");
    rules.expectedPassword = "secret";

    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123", "secret", "")),
              AccessDecision::ALLOWED);
    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123", "", "secret")),
              AccessDecision::ALLOWED);
    // One matching channel is enough even if the other is wrong
    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123", "bad", "secret")),
              AccessDecision::ALLOWED);
    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123", "secret", "bad")),
              AccessDecision::ALLOWED);
}

TEST(AccessPolicyTest, MissingOrWrongPasswordIsUnauthorized) {
    AccessRules rules = rulesFor("abc123");
    rules.expectedPassword = "secret";

    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123")),
              AccessDecision::DENIED_UNAUTHORIZED);
    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123", "bad", "worse")),
              AccessDecision::DENIED_UNAUTHORIZED);
    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123", "Secret")),
              AccessDecision::DENIED_UNAUTHORIZED);
}

TEST(AccessPolicyTest, PasswordCheckedBeforeToken) {
    AccessRules rules = rulesFor("abc123");
    rules.expectedPassword = "secret";

    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("wrong")),
              AccessDecision::DENIED_UNAUTHORIZED);
    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("wrong", "secret")),
              AccessDecision::DENIED_NOT_FOUND);
}

TEST(AccessPolicyTest, EmptyConfiguredPasswordMeansNoPassword) {
    AccessRules rules = rulesFor("abc123");
    rules.expectedPassword = std::string();

    EXPECT_EQ(decideAccess(Clock::now(), rules, creds("abc123")), AccessDecision::ALLOWED);
}

TEST(AccessPolicyTest, SecretEqualsComparesExactly) {
    EXPECT_TRUE(secretEquals("secret", "secret"));
    EXPECT_FALSE(secretEquals("secret", "secreT"));
    EXPECT_FALSE(secretEquals("secret", "secret1"));
    EXPECT_FALSE(secretEquals("", "secret"));
    EXPECT_TRUE(secretEquals("", ""));
}

TEST(AccessPolicyTest, StatusMapping) {
    EXPECT_EQ(httpStatusForDecision(AccessDecision::ALLOWED), 200);
    EXPECT_EQ(httpStatusForDecision(AccessDecision::DENIED_EXPIRED), 410);
    EXPECT_EQ(httpStatusForDecision(AccessDecision::DENIED_UNAUTHORIZED), 401);
    EXPECT_EQ(httpStatusForDecision(AccessDecision::DENIED_NOT_FOUND), 404);
}

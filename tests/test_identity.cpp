#include <gtest/gtest.h>
#include "profile/identity_matcher.hpp"

#include <stdexcept>

using namespace profprune;

// ─── Standard identity ─────────────────────────────────────────

TEST(IdentityTest, StandardUserIdentities) {
    auto standard = IdentityMatcher::standardUser();
    EXPECT_TRUE(standard.matches("S-1-5-21-1111-2222-3333-1001"));
    EXPECT_TRUE(standard.matches("S-1-5-21-1"));
    EXPECT_TRUE(standard.matches("s-1-5-21-1111-2222-3333-500"));  // case-insensitive
}

TEST(IdentityTest, SpecialIdentitiesAreNotStandard) {
    auto standard = IdentityMatcher::standardUser();
    EXPECT_FALSE(standard.matches("S-1-5-18"));                         // LocalSystem
    EXPECT_FALSE(standard.matches("S-1-5-21"));                         // no numeric segment
    EXPECT_FALSE(standard.matches("S-1-5-21-1111-2222-3333-1001.bak"));
    EXPECT_FALSE(standard.matches("S-1-5-21-AAA-1001"));
    EXPECT_FALSE(standard.matches(""));
}

TEST(IdentityTest, CustomStandardPrefix) {
    IdentityConfig cfg;
    cfg.standard_prefix = "S-1-12-1";
    auto azure = IdentityMatcher::standardUser(cfg);
    EXPECT_TRUE(azure.matches("S-1-12-1-100-200"));
    EXPECT_FALSE(azure.matches("S-1-5-21-100-200"));
}

// ─── Desired prefix policy ─────────────────────────────────────

TEST(IdentityTest, PrefixRequiresNumericSuffix) {
    IdentityMatcher policy("S-1-5-21-1111-2222-3333");
    EXPECT_TRUE(policy.matches("S-1-5-21-1111-2222-3333-1001"));
    EXPECT_TRUE(policy.matches("S-1-5-21-1111-2222-3333-1001-7"));
    EXPECT_FALSE(policy.matches("S-1-5-21-1111-2222-3333"));  // bare prefix
    EXPECT_FALSE(policy.matches("S-1-5-21-1111-2222-33334-1001"));
    EXPECT_FALSE(policy.matches("S-1-5-21-4444-5555-6666-1001"));
    EXPECT_FALSE(policy.matches("X-S-1-5-21-1111-2222-3333-1001"));
}

TEST(IdentityTest, PrefixIsMatchedLiterally) {
    IdentityMatcher policy("S.1");
    EXPECT_TRUE(policy.matches("S.1-42"));
    EXPECT_FALSE(policy.matches("SX1-42"));

    IdentityMatcher weird("a+(b)[c]*");
    EXPECT_TRUE(weird.matches("a+(b)[c]*-1"));
    EXPECT_FALSE(weird.matches("aab[c]-1"));
}

TEST(IdentityTest, OverlongIdentityNeverMatches) {
    IdentityMatcher standard = IdentityMatcher::standardUser();

    std::string longest = "S-1-5-21";
    while (longest.size() + 2 <= IdentityMatcher::MAX_IDENTITY_LENGTH) longest += "-1";
    EXPECT_TRUE(standard.matches(longest));

    std::string huge = "S-1-5-21";
    for (int i = 0; i < 200000; ++i) huge += "-1";
    EXPECT_FALSE(standard.matches(huge));
    EXPECT_FALSE(standard.matches(longest + "-1"));
}

TEST(IdentityTest, EmptyPrefixRejected) {
    EXPECT_THROW(IdentityMatcher(""), std::invalid_argument);
}

TEST(IdentityTest, EscapeRegex) {
    EXPECT_EQ(escapeRegex("S-1-5"), "S-1-5");
    EXPECT_EQ(escapeRegex("a.b*"), "a\\.b\\*");
    EXPECT_EQ(escapeRegex("(x)"), "\\(x\\)");
}

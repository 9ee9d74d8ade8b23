#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>
#include <nlohmann/json.hpp>

#include "artcache/cache/rule-key.hh"
#include "artcache/cache/tests/rule-key.hh"

#include <sstream>
#include <unordered_set>

namespace artcache {

/* ----------------------------------------------------------------------------
 * RuleKey::parse
 * --------------------------------------------------------------------------*/

TEST(RuleKey, parseKeepsLowercaseHex)
{
    auto key = RuleKey::parse("0123456789abcdef");
    ASSERT_EQ(key.to_string(), "0123456789abcdef");
}

TEST(RuleKey, parseLowercases)
{
    ASSERT_EQ(RuleKey::parse("DEADbeef").to_string(), "deadbeef");
    ASSERT_EQ(RuleKey::parse("DEADbeef"), RuleKey::parse("deadbeef"));
}

TEST(RuleKey, parseRejectsEmpty)
{
    ASSERT_THROW(RuleKey::parse(""), BadRuleKey);
}

TEST(RuleKey, parseRejectsOddLength)
{
    ASSERT_THROW(RuleKey::parse("abc"), BadRuleKey);
}

TEST(RuleKey, parseRejectsNonHex)
{
    ASSERT_THROW(RuleKey::parse("zz"), BadRuleKey);
    ASSERT_THROW(RuleKey::parse("ab/cd"), BadRuleKey);
    ASSERT_THROW(RuleKey::parse("ab cd "), BadRuleKey);
}

TEST(RuleKey, ordering)
{
    ASSERT_LT(RuleKey::parse("00"), RuleKey::parse("01"));
    ASSERT_LT(RuleKey::parse("0f"), RuleKey::parse("f0"));
}

TEST(RuleKey, hashable)
{
    std::unordered_set<RuleKey> keys{RuleKey::parse("aa"), RuleKey::parse("AA"), RuleKey::parse("bb")};
    ASSERT_EQ(keys.size(), 2u);
}

TEST(RuleKey, streamsAsHex)
{
    std::ostringstream str;
    str << RuleKey::parse("CAFE");
    ASSERT_EQ(str.str(), "cafe");
}

TEST(RuleKey, toJSON)
{
    ASSERT_EQ(nlohmann::json(RuleKey::parse("cafe")), "cafe");
}

RC_GTEST_PROP(RuleKey, parseToStringRoundTrips, (const RuleKey & key))
{
    RC_ASSERT(RuleKey::parse(key.to_string()) == key);
}

} // namespace artcache

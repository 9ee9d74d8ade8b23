#include <gtest/gtest.h>

#include "artcache/cache/artifact-info.hh"

namespace artcache {

TEST(ArtifactInfo, keepsKeysAndMetadata)
{
    auto a = RuleKey::parse("aa"), b = RuleKey::parse("bb");
    ArtifactInfo info({a, b}, {{"key", "value"}});
    ASSERT_EQ(info.ruleKeys(), std::vector<RuleKey>({a, b}));
    ASSERT_EQ(info.metadata(), StringMap({{"key", "value"}}));
}

TEST(ArtifactInfo, dropsDuplicateKeysKeepingFirstOccurrence)
{
    auto a = RuleKey::parse("aa"), b = RuleKey::parse("bb");
    ArtifactInfo info({b, a, b, a});
    ASSERT_EQ(info.ruleKeys(), std::vector<RuleKey>({b, a}));
}

TEST(ArtifactInfo, requiresAKey)
{
    ASSERT_THROW(ArtifactInfo(std::vector<RuleKey>{}), ArtifactInfoError);
}

TEST(ArtifactInfo, hasRuleKey)
{
    ArtifactInfo info({RuleKey::parse("aa")});
    ASSERT_TRUE(info.hasRuleKey(RuleKey::parse("AA")));
    ASSERT_FALSE(info.hasRuleKey(RuleKey::parse("bb")));
}

} // namespace artcache

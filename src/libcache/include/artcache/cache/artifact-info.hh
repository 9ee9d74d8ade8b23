#pragma once
///@file

#include "artcache/cache/rule-key.hh"
#include "artcache/util/types.hh"

#include <vector>

namespace artcache {

MakeError(ArtifactInfoError, Error);

/**
 * The metadata entry naming the build target that produced an
 * artifact.
 */
inline const std::string targetMetadataKey = "TARGET";

/**
 * What is being stored: the rule keys the artifact answers to and the
 * metadata that comes back with it on a hit.
 *
 * The keys keep the order in which they were first given, without
 * duplicates. The first one names the artifact in store requests.
 */
class ArtifactInfo
{
    std::vector<RuleKey> _ruleKeys;
    StringMap _metadata;

public:

    /**
     * @throws ArtifactInfoError if `ruleKeys` is empty.
     */
    ArtifactInfo(const std::vector<RuleKey> & ruleKeys, StringMap metadata = {});

    const std::vector<RuleKey> & ruleKeys() const
    {
        return _ruleKeys;
    }

    const StringMap & metadata() const
    {
        return _metadata;
    }

    bool hasRuleKey(const RuleKey & key) const;
};

} // namespace artcache

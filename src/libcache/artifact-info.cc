#include "artcache/cache/artifact-info.hh"

#include <algorithm>

namespace artcache {

ArtifactInfo::ArtifactInfo(const std::vector<RuleKey> & ruleKeys, StringMap metadata)
    : _metadata(std::move(metadata))
{
    for (auto & key : ruleKeys)
        if (!hasRuleKey(key))
            _ruleKeys.push_back(key);
    if (_ruleKeys.empty())
        throw ArtifactInfoError("an artifact must be stored under at least one rule key");
}

bool ArtifactInfo::hasRuleKey(const RuleKey & key) const
{
    return std::find(_ruleKeys.begin(), _ruleKeys.end(), key) != _ruleKeys.end();
}

} // namespace artcache

#pragma once
///@file

#include "artcache/cache/artifact-cache.hh"

namespace artcache {

/**
 * A cache that never has anything and stores nothing, used when no
 * tiers are configured.
 */
class NoopArtifactCache : public ArtifactCache
{
public:

    using ArtifactCache::store;

    std::string getName() const override
    {
        return "noop";
    }

    CacheResult fetch(const RuleKey & key, LazyPath & output) override;

    void store(const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept override;

    CacheReadMode getCacheReadMode() override
    {
        return CacheReadMode::Passthrough;
    }

    void close() override {}
};

} // namespace artcache

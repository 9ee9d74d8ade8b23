#include "artcache/cache/noop-artifact-cache.hh"

namespace artcache {

CacheResult NoopArtifactCache::fetch(const RuleKey & key, LazyPath & output)
{
    return CacheResult::miss();
}

void NoopArtifactCache::store(
    const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept
{
    callback(StoreResult{});
}

} // namespace artcache

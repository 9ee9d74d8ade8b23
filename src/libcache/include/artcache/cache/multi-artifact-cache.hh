#pragma once
///@file

#include "artcache/cache/artifact-cache.hh"
#include "artcache/util/ref.hh"
#include "artcache/util/thread-pool.hh"

#include <atomic>
#include <vector>

namespace artcache {

/**
 * An ordered chain of caches, fastest first, that behaves as one.
 *
 * - A fetch tries each cache in turn. A hit in one cache is copied in
 *   the background to every faster cache, whatever their read mode.
 *
 * - A store goes to every read-write cache. Only the last of them may
 *   borrow the file, and it is only handed the file once the others
 *   are done with it.
 */
class MultiArtifactCache : public ArtifactCache
{
    std::vector<ref<ArtifactCache>> caches;

    ThreadPool promotionPool;

    std::atomic_bool closed{false};

    struct StoreState;

public:

    MultiArtifactCache(std::vector<ref<ArtifactCache>> caches, size_t promotionThreads = 2);

    ~MultiArtifactCache();

    using ArtifactCache::store;

    std::string getName() const override;

    CacheResult fetch(const RuleKey & key, LazyPath & output) override;

    void store(const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept override;

    /**
     * ReadWrite if any cache is, otherwise ReadOnly if any cache is,
     * otherwise Passthrough.
     */
    CacheReadMode getCacheReadMode() override;

    /**
     * Wait for outstanding promotions, then close every cache.
     *
     * @throws CacheCloseError naming every cache that failed to close.
     */
    void close() override;

    /**
     * Block until every promotion started so far has finished.
     */
    void waitForPromotions();

    const std::vector<ref<ArtifactCache>> & getCaches() const
    {
        return caches;
    }

private:

    void promote(const RuleKey & key, const CacheResult & result, const std::filesystem::path & path, size_t tier);
};

} // namespace artcache

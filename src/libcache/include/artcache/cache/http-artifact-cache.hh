#pragma once
///@file

#include "artcache/cache/artifact-cache.hh"
#include "artcache/cache/http-service.hh"
#include "artcache/util/thread-pool.hh"

#include <atomic>

namespace artcache {

struct HttpArtifactCacheParams
{
    std::string name = "http";

    CacheReadMode readMode = CacheReadMode::ReadWrite;

    /**
     * Template of the warning printed when a request fails.
     * `{cache_name}` and `{error_message}` are substituted.
     */
    std::string errorMessageFormat = defaultCacheErrorMessage;

    size_t storeThreads = 4;

    /**
     * Artifacts larger than this are not uploaded. 0 means no limit.
     */
    uint64_t maxStoreSize = 0;
};

/**
 * A remote cache spoken to over HTTP:
 *
 * - `GET /artifacts/key/<key>` answers 404 for a miss, or 200 with a
 *   fetch response body for a hit.
 *
 * - `POST /artifacts/key/<first key>` with a store request body stores
 *   an artifact under all of its keys.
 *
 * Each call makes one request and is never retried. Stores run on a
 * dedicated pool of worker threads.
 */
class HttpArtifactCache : public ArtifactCache
{
    HttpArtifactCacheParams params;

    ref<HttpService> service;

    ThreadPool storePool;

    std::atomic_bool closed{false};

public:

    HttpArtifactCache(HttpArtifactCacheParams params, ref<HttpService> service);

    ~HttpArtifactCache();

    using ArtifactCache::store;

    std::string getName() const override
    {
        return params.name;
    }

    CacheResult fetch(const RuleKey & key, LazyPath & output) override;

    void store(const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept override;

    CacheReadMode getCacheReadMode() override
    {
        return params.readMode;
    }

    void close() override;

private:

    CacheResult fetchImpl(const RuleKey & key, LazyPath & output);

    StoreResult storeImpl(const ArtifactInfo & info, const BorrowablePath & output);

    /**
     * Warn about a failed request, through the configured template.
     */
    void reportFailure(std::string_view errorMessage);
};

} // namespace artcache

#pragma once
///@file

#include "artcache/cache/artifact-info.hh"
#include "artcache/cache/borrowable-path.hh"
#include "artcache/cache/cache-read-mode.hh"
#include "artcache/cache/cache-result.hh"
#include "artcache/cache/lazy-path.hh"
#include "artcache/cache/rule-key.hh"
#include "artcache/util/callback.hh"
#include "artcache/util/logging.hh"

#include <future>

namespace artcache {

MakeError(CacheClosed, Error);
MakeError(CacheCloseError, Error);

/**
 * The completion value of a store.
 */
struct StoreResult
{
    /**
     * Bytes of artifact data written, 0 if the store was skipped.
     */
    uint64_t artifactSizeBytes = 0;
};

/**
 * A place where build outputs can be looked up by rule key, and put
 * for later builds to find.
 */
class ArtifactCache
{
public:

    virtual ~ArtifactCache() {}

    /**
     * Display name, used in diagnostics and in `CacheResult::cacheSource`.
     */
    virtual std::string getName() const = 0;

    /**
     * Look up `key`, writing the artifact to `output` on a hit.
     *
     * Absence is a miss. Protocol and network failures are reported as
     * an error result, not thrown.
     *
     * @throws OutputPathError if `output` cannot be materialised.
     */
    virtual CacheResult fetch(const RuleKey & key, LazyPath & output) = 0;

    /**
     * Store the file at `output` under every key of `info`, calling
     * `callback` once the store has finished or failed. May run
     * asynchronously and never blocks on the network.
     */
    virtual void store(const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept = 0;

    std::future<StoreResult> store(const ArtifactInfo & info, const BorrowablePath & output);

    virtual CacheReadMode getCacheReadMode() = 0;

    /**
     * Release connections and worker threads, letting stores that are
     * already queued finish. Idempotent. Stores submitted afterwards
     * fail with `CacheClosed`.
     */
    virtual void close() = 0;
};

/**
 * The fields of a `CacheFetch` or `CacheStore` activity: the cache
 * name, its kind (`dir`, `http` or `multi`), the rule keys separated by
 * commas, and the build target from `metadata` or "" if there is none.
 */
Logger::Fields cacheActivityFields(
    std::string_view cacheName, std::string_view kind, const std::vector<RuleKey> & keys, const StringMap & metadata = {});

/**
 * Warn that a request to a cache failed. `{cache_name}` and
 * `{error_message}` are substituted into `format`.
 */
void warnCacheFailure(std::string_view format, std::string_view cacheName, std::string_view errorMessage);

/**
 * The default for `format` above.
 */
inline const std::string defaultCacheErrorMessage = "{cache_name} encountered an error: {error_message}";

} // namespace artcache

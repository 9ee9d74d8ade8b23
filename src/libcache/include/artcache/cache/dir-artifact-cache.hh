#pragma once
///@file

#include "artcache/cache/artifact-cache.hh"

#include <atomic>
#include <filesystem>

namespace artcache {

/**
 * A cache in a local directory. Artifact `<key>` lives at
 * `<root>/<first two hex digits>/<key>`, its metadata beside it in
 * `<key>.metadata`. The metadata is written before the artifact, so an
 * artifact without metadata is one whose store has not finished, and
 * is a miss.
 *
 * Stores complete before `store()` returns. A borrowable file is moved
 * into the cache instead of copied.
 */
class DirArtifactCache : public ArtifactCache
{
    std::string name;
    std::filesystem::path root;
    CacheReadMode readMode;
    std::string errorMessageFormat;
    std::atomic_bool closed{false};

public:

    /**
     * @param errorMessageFormat Template of the warning printed when a
     * fetch or store fails, as for `HttpArtifactCacheParams`.
     */
    DirArtifactCache(
        std::string name,
        std::filesystem::path root,
        CacheReadMode readMode = CacheReadMode::ReadWrite,
        std::string errorMessageFormat = defaultCacheErrorMessage);

    using ArtifactCache::store;

    std::string getName() const override
    {
        return name;
    }

    CacheResult fetch(const RuleKey & key, LazyPath & output) override;

    void store(const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept override;

    CacheReadMode getCacheReadMode() override
    {
        return readMode;
    }

    void close() override
    {
        closed = true;
    }

    std::filesystem::path artifactPath(const RuleKey & key) const;

    std::filesystem::path metadataPath(const RuleKey & key) const;

private:

    CacheResult fetchImpl(const RuleKey & key, LazyPath & output);

    StoreResult storeImpl(const ArtifactInfo & info, const BorrowablePath & output);
};

} // namespace artcache

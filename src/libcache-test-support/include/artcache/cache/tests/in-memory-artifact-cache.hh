#pragma once
///@file

#include "artcache/cache/artifact-cache.hh"
#include "artcache/util/sync.hh"

#include <map>

namespace artcache {

/**
 * An ArtifactCache that keeps artifacts in memory, for testing code
 * that drives caches.
 *
 * Stores complete synchronously unless `holdStores` is set, in which
 * case they wait for `completeHeldStores()`. A borrowed file is
 * deleted once read, as a cache that moves it away would.
 */
class InMemoryArtifactCache : public ArtifactCache
{
public:

    struct Entry
    {
        std::string contents;
        StringMap metadata;
    };

    struct State
    {
        std::map<RuleKey, Entry> entries;
        size_t fetchCalls = 0;
        size_t storeCalls = 0;
        size_t closeCalls = 0;
        std::vector<BorrowablePath> storedPaths;
        std::vector<std::function<void()>> heldStores;
        bool closed = false;
    };

    Sync<State> state_;

    std::string name;

    CacheReadMode readMode;

    /**
     * If set, fetches return an error result with this message.
     */
    std::optional<std::string> fetchError;

    /**
     * If set, stores fail with this message.
     */
    std::optional<std::string> storeError;

    /**
     * If set, `close()` throws with this message.
     */
    std::optional<std::string> closeError;

    bool holdStores = false;

    InMemoryArtifactCache(std::string name, CacheReadMode readMode = CacheReadMode::ReadWrite)
        : name(std::move(name))
        , readMode(readMode)
    {
    }

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

    void close() override;

    void put(const RuleKey & key, std::string contents, StringMap metadata = {});

    std::optional<Entry> get(const RuleKey & key);

    /**
     * Run the stores held back so far, in order.
     */
    void completeHeldStores();

private:

    StoreResult storeNow(const ArtifactInfo & info, const BorrowablePath & output);
};

} // namespace artcache

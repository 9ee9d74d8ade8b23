#include "artcache/cache/multi-artifact-cache.hh"
#include "artcache/util/logging.hh"
#include "artcache/util/strings.hh"
#include "artcache/util/sync.hh"

namespace artcache {

MultiArtifactCache::MultiArtifactCache(std::vector<ref<ArtifactCache>> caches, size_t promotionThreads)
    : caches(std::move(caches))
    , promotionPool(promotionThreads, "promotion pool")
{
}

MultiArtifactCache::~MultiArtifactCache()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

std::string MultiArtifactCache::getName() const
{
    Strings names;
    for (auto & cache : caches)
        names.push_back(cache->getName());
    return "multi(" + concatStringsSep(", ", names) + ")";
}

CacheResult MultiArtifactCache::fetch(const RuleKey & key, LazyPath & output)
{
    auto name = getName();
    Activity act(
        *logger,
        lvlDebug,
        ActivityType::CacheFetch,
        fmt("fetching '%s' from cache '%s'", key, name),
        cacheActivityFields(name, "multi", {key}));

    auto combined = [&]() {
        PushActivity pact(act.id);

        std::optional<CacheResult> lastError;

        for (size_t i = 0; i < caches.size(); ++i) {
            auto result = caches[i]->fetch(key, output);
            switch (result.type) {
            case CacheResultType::Hit:
                if (i > 0)
                    promote(key, result, output.get(), i);
                return result;
            case CacheResultType::Error:
                lastError = std::move(result);
                break;
            case CacheResultType::Miss:
                break;
            }
        }

        return lastError ? std::move(*lastError) : CacheResult::miss();
    }();

    act.result(
        ResultType::CacheFetchResult,
        std::string(showCacheResultType(combined.type)),
        combined.artifactSizeBytes.value_or(0));

    return combined;
}

void MultiArtifactCache::promote(
    const RuleKey & key, const CacheResult & result, const std::filesystem::path & path, size_t tier)
{
    ArtifactInfo info({key}, result.metadata);

    /* Promotion stores belong to the fetch that found the artifact. */
    auto parent = getCurActivity();

    for (size_t j = 0; j < tier; ++j) {
        auto cache = caches[j];
        try {
            promotionPool.enqueue([cache, info, path, parent]() {
                PushActivity pact(parent);
                try {
                    cache->store(info, BorrowablePath::notBorrowable(path)).get();
                    debug("promoted '%s' to cache '%s'", info.ruleKeys().front(), cache->getName());
                } catch (Error & e) {
                    warn("promoting '%s' to cache '%s' failed: %s", info.ruleKeys().front(), cache->getName(), e.message());
                }
            });
        } catch (ThreadPoolShutDown &) {
            debug("not promoting '%s' to cache '%s' because the cache is closed", key, cache->getName());
        }
    }
}

void MultiArtifactCache::waitForPromotions()
{
    promotionPool.process();
}

/**
 * The progress of one store across all writable caches.
 */
struct MultiArtifactCache::StoreState
{
    ArtifactInfo info;

    BorrowablePath output;

    std::vector<ref<ArtifactCache>> targets;

    Callback<StoreResult> callback;

    /**
     * Stopped just before `callback` is called.
     */
    std::unique_ptr<Activity> act;

    struct Data
    {
        size_t remaining;
        std::exception_ptr firstError;
        uint64_t artifactSizeBytes = 0;
    };

    Sync<Data> data;

    StoreState(
        ArtifactInfo info,
        BorrowablePath output,
        std::vector<ref<ArtifactCache>> targets,
        Callback<StoreResult> && callback,
        std::unique_ptr<Activity> act)
        : info(std::move(info))
        , output(std::move(output))
        , targets(std::move(targets))
        , callback(std::move(callback))
        , act(std::move(act))
        , data(Data{.remaining = this->targets.size()})
    {
    }

    /**
     * Whether the last target borrows the file, and so has to wait for
     * the others.
     */
    bool deferLast() const
    {
        return output.canBorrow && targets.size() > 1;
    }

    static void start(std::shared_ptr<StoreState> state, size_t i)
    {
        auto & target = state->targets[i];
        bool last = i + 1 == state->targets.size();
        PushActivity pact(state->act->id);
        target->store(
            state->info,
            last ? state->output : BorrowablePath::notBorrowable(state->output.path),
            {[state, i](std::future<StoreResult> fut) { state->finished(state, i, fut); }});
    }

    void finished(std::shared_ptr<StoreState> self, size_t i, std::future<StoreResult> & fut)
    {
        std::optional<StoreResult> result;
        std::exception_ptr error;
        try {
            result = fut.get();
        } catch (...) {
            error = std::current_exception();
        }

        bool startLast = false;
        bool done = false;
        std::exception_ptr firstError;
        uint64_t size = 0;
        {
            auto d(data.lock());
            if (result)
                d->artifactSizeBytes = std::max(d->artifactSizeBytes, result->artifactSizeBytes);
            else if (!d->firstError)
                d->firstError = error;
            else {
                try {
                    std::rethrow_exception(error);
                } catch (std::exception & e) {
                    printError("storing '%s' in cache '%s' failed: %s", info.ruleKeys().front(), targets[i]->getName(), e.what());
                }
            }
            d->remaining--;
            startLast = deferLast() && d->remaining == 1 && i + 1 != targets.size();
            done = d->remaining == 0;
            firstError = d->firstError;
            size = d->artifactSizeBytes;
        }

        if (startLast)
            start(self, targets.size() - 1);
        else if (done) {
            act->result(ResultType::CacheStoreResult, (uint64_t) !firstError, size);
            act.reset();
            if (firstError)
                callback.rethrow(firstError);
            else
                callback(StoreResult{size});
        }
    }
};

void MultiArtifactCache::store(
    const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept
{
    std::unique_ptr<Activity> act;

    try {
        auto name = getName();
        act = std::make_unique<Activity>(
            *logger,
            lvlDebug,
            ActivityType::CacheStore,
            fmt("storing '%s' in cache '%s'", info.ruleKeys().front(), name),
            cacheActivityFields(name, "multi", info.ruleKeys(), info.metadata()));

        if (closed)
            throw CacheClosed("cannot store to cache '%s' because it is closed", name);
    } catch (...) {
        act.reset();
        callback.rethrow();
        return;
    }

    std::vector<ref<ArtifactCache>> targets;
    for (auto & cache : caches)
        if (isWritable(cache->getCacheReadMode()))
            targets.push_back(cache);

    if (targets.empty()) {
        act->result(ResultType::CacheStoreResult, (uint64_t) 1, (uint64_t) 0);
        act.reset();
        callback(StoreResult{});
        return;
    }

    auto state = std::make_shared<StoreState>(info, output, std::move(targets), std::move(callback), std::move(act));

    /* Children report failures through their callbacks, so starting
       them doesn't throw. */
    auto n = state->deferLast() ? state->targets.size() - 1 : state->targets.size();
    for (size_t i = 0; i < n; ++i)
        StoreState::start(state, i);
}

CacheReadMode MultiArtifactCache::getCacheReadMode()
{
    bool readOnly = false;
    for (auto & cache : caches) {
        auto mode = cache->getCacheReadMode();
        if (mode == CacheReadMode::ReadWrite)
            return CacheReadMode::ReadWrite;
        if (mode == CacheReadMode::ReadOnly)
            readOnly = true;
    }
    return readOnly ? CacheReadMode::ReadOnly : CacheReadMode::Passthrough;
}

void MultiArtifactCache::close()
{
    if (closed.exchange(true))
        return;

    try {
        promotionPool.process();
    } catch (Error & e) {
        printError("promotion failed: %s", e.message());
    }
    promotionPool.shutdown();

    Strings failures;
    for (auto & cache : caches) {
        try {
            cache->close();
        } catch (Error & e) {
            failures.push_back(fmt("'%s': %s", cache->getName(), e.message()));
        }
    }

    if (!failures.empty())
        throw CacheCloseError("failed to close %d cache(s): %s", failures.size(), concatStringsSep("; ", failures));
}

} // namespace artcache

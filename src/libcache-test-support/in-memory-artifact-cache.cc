#include "artcache/cache/tests/in-memory-artifact-cache.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

CacheResult InMemoryArtifactCache::fetch(const RuleKey & key, LazyPath & output)
{
    std::optional<Entry> entry;
    {
        auto state(state_.lock());
        state->fetchCalls++;
        if (!fetchError) {
            auto i = state->entries.find(key);
            if (i != state->entries.end())
                entry = i->second;
        }
    }

    if (fetchError)
        return CacheResult::error(name, std::nullopt, *fetchError);

    if (!entry)
        return CacheResult::miss();

    writeFile(output.get(), entry->contents);
    return CacheResult::hit(name, std::nullopt, entry->metadata, entry->contents.size());
}

void InMemoryArtifactCache::store(
    const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept
{
    auto callbackPtr = std::make_shared<decltype(callback)>(std::move(callback));

    auto run = [this, info, output, callbackPtr]() {
        try {
            (*callbackPtr)(storeNow(info, output));
        } catch (...) {
            callbackPtr->rethrow();
        }
    };

    {
        auto state(state_.lock());
        state->storeCalls++;
        if (holdStores) {
            state->heldStores.push_back(std::move(run));
            return;
        }
    }

    run();
}

StoreResult InMemoryArtifactCache::storeNow(const ArtifactInfo & info, const BorrowablePath & output)
{
    if (state_.lock()->closed)
        throw CacheClosed("cannot store to cache '%s' because it is closed", name);

    if (storeError)
        throw Error(*storeError);

    auto contents = readFile(output.path);

    if (output.canBorrow)
        deletePath(output.path);

    auto state(state_.lock());
    for (auto & key : info.ruleKeys())
        state->entries.insert_or_assign(key, Entry{contents, info.metadata()});
    state->storedPaths.push_back(output);

    return StoreResult{contents.size()};
}

void InMemoryArtifactCache::close()
{
    {
        auto state(state_.lock());
        state->closed = true;
        state->closeCalls++;
    }
    if (closeError)
        throw Error(*closeError);
}

void InMemoryArtifactCache::put(const RuleKey & key, std::string contents, StringMap metadata)
{
    state_.lock()->entries.insert_or_assign(key, Entry{std::move(contents), std::move(metadata)});
}

std::optional<InMemoryArtifactCache::Entry> InMemoryArtifactCache::get(const RuleKey & key)
{
    auto state(state_.lock());
    auto i = state->entries.find(key);
    if (i == state->entries.end())
        return std::nullopt;
    return i->second;
}

void InMemoryArtifactCache::completeHeldStores()
{
    std::vector<std::function<void()>> held;
    std::swap(held, state_.lock()->heldStores);
    for (auto & run : held)
        run();
}

} // namespace artcache

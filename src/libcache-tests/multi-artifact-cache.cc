#include <gtest/gtest.h>

#include "artcache/cache/dir-artifact-cache.hh"
#include "artcache/cache/multi-artifact-cache.hh"
#include "artcache/cache/tests/capturing-logger.hh"
#include "artcache/cache/tests/in-memory-artifact-cache.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

class MultiArtifactCacheTest : public ::testing::Test
{
protected:
    std::filesystem::path tmpDir;
    std::unique_ptr<AutoDelete> delTmpDir;
    std::filesystem::path output;

    const RuleKey dummyRuleKey = RuleKey::parse("76b1c1beae69428db2d1befb31cf743ac8ce90df");

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        output = tmpDir / "out" / "file";
    }

    std::filesystem::path writeArtifact(std::string_view contents)
    {
        auto path = tmpDir / "artifact";
        writeFile(path, contents);
        return path;
    }

    static ref<InMemoryArtifactCache> makeCache(std::string name, CacheReadMode mode = CacheReadMode::ReadWrite)
    {
        return make_ref<InMemoryArtifactCache>(std::move(name), mode);
    }
};

/* ----------------------------------------------------------------------------
 * fetch
 * --------------------------------------------------------------------------*/

TEST_F(MultiArtifactCacheTest, cacheFetch)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two"), cache3 = makeCache("three");
    MultiArtifactCache multi({cache1, cache2, cache3});

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(multi.fetch(dummyRuleKey, lazy).type, CacheResultType::Miss) << "Fetch should fail when nothing is there.";

    cache2->put(dummyRuleKey, "data");

    auto lazy2 = LazyPath::ofPath(output);
    auto result = multi.fetch(dummyRuleKey, lazy2);
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.cacheSource, "two");
    ASSERT_EQ(readFile(output), "data");
    ASSERT_EQ(cache3->state_.lock()->fetchCalls, 1u) << "Caches after a hit should not be consulted.";

    multi.close();
}

TEST_F(MultiArtifactCacheTest, missLeavesNoOutput)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    MultiArtifactCache multi({cache1, cache2});

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(multi.fetch(dummyRuleKey, lazy).type, CacheResultType::Miss);
    ASSERT_FALSE(pathExists(output));
}

TEST_F(MultiArtifactCacheTest, preserveErrorsFromInnerCache)
{
    auto inner = makeCache("erroring");
    inner->fetchError = "network is down";
    MultiArtifactCache multi({inner});

    auto lazy = LazyPath::ofPath(output);
    auto result = multi.fetch(dummyRuleKey, lazy);
    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_EQ(result.cacheSource, "erroring");
    ASSERT_EQ(result.cacheError, "network is down");
}

TEST_F(MultiArtifactCacheTest, lastErrorWinsOverMisses)
{
    auto cache1 = makeCache("first"), cache2 = makeCache("second"), cache3 = makeCache("third");
    cache1->fetchError = "first failure";
    cache2->fetchError = "second failure";
    MultiArtifactCache multi({cache1, cache2, cache3});

    auto lazy = LazyPath::ofPath(output);
    auto result = multi.fetch(dummyRuleKey, lazy);
    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_EQ(result.cacheError, "second failure");
    ASSERT_EQ(cache3->state_.lock()->fetchCalls, 1u);
}

TEST_F(MultiArtifactCacheTest, hitAfterErrorIsHit)
{
    auto cache1 = makeCache("erroring"), cache2 = makeCache("good");
    cache1->fetchError = "boom";
    cache2->put(dummyRuleKey, "data");
    MultiArtifactCache multi({cache1, cache2});

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(multi.fetch(dummyRuleKey, lazy).type, CacheResultType::Hit);
    multi.waitForPromotions();
}

/* ----------------------------------------------------------------------------
 * Promotion
 * --------------------------------------------------------------------------*/

TEST_F(MultiArtifactCacheTest, propagateOnlyCacheGet)
{
    auto cache1 = makeCache("passthrough", CacheReadMode::Passthrough), cache2 = makeCache("rw");
    MultiArtifactCache multi({cache1, cache2});

    cache2->store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("data"))).get();

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(multi.fetch(dummyRuleKey, lazy).type, CacheResultType::Hit)
        << "Fetch should find artifact that's present in one of the caches.";

    multi.waitForPromotions();

    ASSERT_TRUE(cache1->get(dummyRuleKey)) << "Fetch should have propagated the artifact.";
    ASSERT_EQ(cache1->get(dummyRuleKey)->contents, "data");
}

TEST_F(MultiArtifactCacheTest, promotesToEveryFasterCache)
{
    auto cache1 = makeCache("one", CacheReadMode::ReadOnly), cache2 = makeCache("two"), cache3 = makeCache("three"),
         cache4 = makeCache("four");
    cache3->put(dummyRuleKey, "data");
    MultiArtifactCache multi({cache1, cache2, cache3, cache4});

    auto lazy = LazyPath::ofPath(output);
    multi.fetch(dummyRuleKey, lazy);
    multi.waitForPromotions();

    ASSERT_TRUE(cache1->get(dummyRuleKey));
    ASSERT_TRUE(cache2->get(dummyRuleKey));
    ASSERT_EQ(cache4->state_.lock()->storeCalls, 0u);
    ASSERT_EQ(cache3->state_.lock()->storeCalls, 0u);
}

TEST_F(MultiArtifactCacheTest, noPromotionOnFirstTierHit)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    cache1->put(dummyRuleKey, "data");
    MultiArtifactCache multi({cache1, cache2});

    auto lazy = LazyPath::ofPath(output);
    multi.fetch(dummyRuleKey, lazy);
    multi.waitForPromotions();

    ASSERT_EQ(cache1->state_.lock()->storeCalls, 0u);
    ASSERT_EQ(cache2->state_.lock()->storeCalls, 0u);
}

TEST_F(MultiArtifactCacheTest, cacheFetchPushesMetadataToHigherCache)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    MultiArtifactCache multi({cache1, cache2});

    StringMap metadata{{"hello", "world"}};
    cache2->put(dummyRuleKey, "", metadata);

    auto lazy = LazyPath::ofPath(output);
    multi.fetch(dummyRuleKey, lazy);
    multi.waitForPromotions();

    auto lazy2 = LazyPath::ofPath(tmpDir / "second");
    auto result = cache1->fetch(dummyRuleKey, lazy2);
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.metadata, metadata);
}

TEST_F(MultiArtifactCacheTest, promotionDoesNotConsumeFetchedFile)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two", CacheReadMode::ReadOnly);
    cache2->put(dummyRuleKey, "data");
    MultiArtifactCache multi({cache1, cache2});

    auto lazy = LazyPath::ofPath(output);
    multi.fetch(dummyRuleKey, lazy);
    multi.waitForPromotions();

    ASSERT_TRUE(pathExists(output)) << "Promotion should not delete the path it's fetching.";
    auto stored = cache1->state_.lock()->storedPaths;
    ASSERT_EQ(stored.size(), 1u);
    ASSERT_FALSE(stored[0].canBorrow);
}

TEST_F(MultiArtifactCacheTest, promotionFailureIsOnlyAWarning)
{
    CaptureLogs logs;

    auto cache1 = makeCache("broken"), cache2 = makeCache("good");
    cache1->storeError = "disk full";
    cache2->put(dummyRuleKey, "data");
    MultiArtifactCache multi({cache1, cache2});

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(multi.fetch(dummyRuleKey, lazy).type, CacheResultType::Hit);
    ASSERT_NO_THROW(multi.waitForPromotions());
    ASSERT_TRUE(logs->contains("disk full", lvlWarn));
}

/* ----------------------------------------------------------------------------
 * store
 * --------------------------------------------------------------------------*/

TEST_F(MultiArtifactCacheTest, cacheStore)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    MultiArtifactCache multi({cache1, cache2});

    auto result = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("data"))).get();

    ASSERT_EQ(result.artifactSizeBytes, 4u);
    ASSERT_TRUE(cache1->get(dummyRuleKey)) << "MultiArtifactCache.store() should store to all contained caches.";
    ASSERT_TRUE(cache2->get(dummyRuleKey)) << "MultiArtifactCache.store() should store to all contained caches.";
    ASSERT_TRUE(pathExists(tmpDir / "artifact"));
}

TEST_F(MultiArtifactCacheTest, propagateOnlyCacheStore)
{
    auto cache1 = makeCache("passthrough", CacheReadMode::Passthrough), cache2 = makeCache("readonly", CacheReadMode::ReadOnly),
         cache3 = makeCache("rw");
    MultiArtifactCache multi({cache1, cache2, cache3});

    ASSERT_EQ(multi.getCacheReadMode(), CacheReadMode::ReadWrite);

    multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("data"))).get();

    ASSERT_FALSE(cache1->get(dummyRuleKey)) << "This cache is PASSTHROUGH, store on the multi-cache should not write to it";
    ASSERT_FALSE(cache2->get(dummyRuleKey)) << "This cache is READONLY, store on the multi-cache should not write to it";
    ASSERT_TRUE(cache3->get(dummyRuleKey));
}

TEST_F(MultiArtifactCacheTest, storeWithoutWritableCachesSucceeds)
{
    auto cache1 = makeCache("ro", CacheReadMode::ReadOnly);
    MultiArtifactCache multi({cache1});

    auto result = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::borrowable(writeArtifact("data"))).get();

    ASSERT_EQ(result.artifactSizeBytes, 0u);
    ASSERT_EQ(cache1->state_.lock()->storeCalls, 0u);
    ASSERT_TRUE(pathExists(tmpDir / "artifact"));
}

TEST_F(MultiArtifactCacheTest, storeFailureIsReportedAfterAllStoresFinish)
{
    auto cache1 = makeCache("broken"), cache2 = makeCache("good");
    cache1->storeError = "disk full";
    MultiArtifactCache multi({cache1, cache2});

    auto fut = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("data")));
    ASSERT_THROW(fut.get(), Error);
    ASSERT_TRUE(cache2->get(dummyRuleKey)) << "A failing cache should not keep the others from storing.";
}

TEST_F(MultiArtifactCacheTest, onlyLastWritableCacheBorrows)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two", CacheReadMode::ReadOnly), cache3 = makeCache("three");
    cache1->holdStores = true;
    MultiArtifactCache multi({cache1, cache2, cache3});

    auto fut = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::borrowable(writeArtifact("data")));

    ASSERT_EQ(cache1->state_.lock()->storeCalls, 1u);
    ASSERT_EQ(cache3->state_.lock()->storeCalls, 0u)
        << "The borrowing cache must wait until the others are done with the file.";

    cache1->completeHeldStores();

    ASSERT_EQ(fut.get().artifactSizeBytes, 4u);
    ASSERT_FALSE(cache1->state_.lock()->storedPaths[0].canBorrow);
    ASSERT_TRUE(cache3->state_.lock()->storedPaths[0].canBorrow);
    ASSERT_EQ(cache1->get(dummyRuleKey)->contents, "data");
    ASSERT_EQ(cache3->get(dummyRuleKey)->contents, "data");
    ASSERT_FALSE(pathExists(tmpDir / "artifact")) << "The borrowing cache took the file.";
}

TEST_F(MultiArtifactCacheTest, borrowerWaitsForEveryOtherWritableCache)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two"), cache3 = makeCache("three");
    cache1->holdStores = true;
    cache2->holdStores = true;
    MultiArtifactCache multi({cache1, cache2, cache3});

    auto fut = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::borrowable(writeArtifact("data")));

    ASSERT_EQ(cache1->state_.lock()->storeCalls, 1u);
    ASSERT_EQ(cache2->state_.lock()->storeCalls, 1u);
    ASSERT_EQ(cache3->state_.lock()->storeCalls, 0u);

    cache1->completeHeldStores();

    ASSERT_EQ(cache3->state_.lock()->storeCalls, 0u) << "One cache still needs the file.";
    ASSERT_TRUE(pathExists(tmpDir / "artifact"));

    cache2->completeHeldStores();

    ASSERT_EQ(fut.get().artifactSizeBytes, 4u);
    ASSERT_EQ(cache3->state_.lock()->storeCalls, 1u);
    ASSERT_FALSE(cache1->state_.lock()->storedPaths[0].canBorrow);
    ASSERT_FALSE(cache2->state_.lock()->storedPaths[0].canBorrow);
    ASSERT_TRUE(cache3->state_.lock()->storedPaths[0].canBorrow);
    ASSERT_EQ(cache2->get(dummyRuleKey)->contents, "data");
    ASSERT_EQ(cache3->get(dummyRuleKey)->contents, "data");
    ASSERT_FALSE(pathExists(tmpDir / "artifact"));
}

TEST_F(MultiArtifactCacheTest, storingTwiceIsHarmless)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    MultiArtifactCache multi({cache1, cache2});

    ArtifactInfo info({dummyRuleKey}, {{"build", "42"}});
    auto path = writeArtifact("same bytes");

    multi.store(info, BorrowablePath::notBorrowable(path)).get();
    multi.store(info, BorrowablePath::notBorrowable(path)).get();

    auto lazy = LazyPath::ofPath(output);
    auto result = multi.fetch(dummyRuleKey, lazy);
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.metadata, StringMap({{"build", "42"}}));
    ASSERT_EQ(readFile(output), "same bytes");
    ASSERT_EQ(cache2->get(dummyRuleKey)->contents, "same bytes");
}

TEST_F(MultiArtifactCacheTest, borrowingCacheWaitsForFailedStores)
{
    auto cache1 = makeCache("broken"), cache2 = makeCache("borrower");
    cache1->storeError = "disk full";
    cache1->holdStores = true;
    MultiArtifactCache multi({cache1, cache2});

    auto fut = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::borrowable(writeArtifact("data")));
    ASSERT_EQ(cache2->state_.lock()->storeCalls, 0u);

    cache1->completeHeldStores();

    ASSERT_THROW(fut.get(), Error);
    ASSERT_TRUE(cache2->get(dummyRuleKey));
}

TEST_F(MultiArtifactCacheTest, nonBorrowableStoresRunTogether)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    cache1->holdStores = true;
    MultiArtifactCache multi({cache1, cache2});

    auto fut = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("data")));

    ASSERT_EQ(cache2->state_.lock()->storeCalls, 1u);
    ASSERT_TRUE(cache2->get(dummyRuleKey));

    cache1->completeHeldStores();
    fut.get();
    ASSERT_TRUE(pathExists(tmpDir / "artifact"));
}

TEST_F(MultiArtifactCacheTest, singleWritableCacheMayBorrow)
{
    auto cache1 = makeCache("only");
    MultiArtifactCache multi({cache1});

    multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::borrowable(writeArtifact("data"))).get();

    ASSERT_TRUE(cache1->state_.lock()->storedPaths[0].canBorrow);
}

/* ----------------------------------------------------------------------------
 * Activities
 * --------------------------------------------------------------------------*/

TEST_F(MultiArtifactCacheTest, fetchesOfEachCacheAreChildrenOfTheMultiFetch)
{
    CaptureLogs logs;

    auto local = make_ref<DirArtifactCache>("local", tmpDir / "local");
    auto shared = make_ref<DirArtifactCache>("shared", tmpDir / "shared");
    shared->store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("data"))).get();

    MultiArtifactCache multi({local, shared});

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(multi.fetch(dummyRuleKey, lazy).type, CacheResultType::Hit);
    multi.waitForPromotions();

    auto fetches = logs->getActivities(ActivityType::CacheFetch);
    ASSERT_EQ(fetches.size(), 3u);
    ASSERT_EQ(fetches[0].fields, std::vector<std::string>({"multi(local, shared)", "multi", dummyRuleKey.to_string(), ""}));
    ASSERT_EQ(fetches[0].results[0].second[0], "hit");
    ASSERT_TRUE(fetches[0].stopped);

    ASSERT_EQ(fetches[1].fields[0], "local");
    ASSERT_EQ(fetches[1].parent, fetches[0].id);
    ASSERT_EQ(fetches[1].results[0].second[0], "miss");

    ASSERT_EQ(fetches[2].fields[0], "shared");
    ASSERT_EQ(fetches[2].parent, fetches[0].id);
    ASSERT_EQ(fetches[2].results[0].second[0], "hit");

    /* The first store is the one made directly above. */
    auto stores = logs->getActivities(ActivityType::CacheStore);
    ASSERT_EQ(stores.size(), 2u);
    ASSERT_EQ(stores[1].fields[0], "local");
    ASSERT_EQ(stores[1].parent, fetches[0].id) << "The promotion belongs to the fetch that caused it.";
    ASSERT_TRUE(stores[1].stopped);
}

TEST_F(MultiArtifactCacheTest, storesOfEachCacheAreChildrenOfTheMultiStore)
{
    CaptureLogs logs;

    auto local = make_ref<DirArtifactCache>("local", tmpDir / "local");
    auto shared = make_ref<DirArtifactCache>("shared", tmpDir / "shared");
    MultiArtifactCache multi({local, shared});

    auto result = multi
                      .store(
                          ArtifactInfo({dummyRuleKey}, {{targetMetadataKey, "//foo:bar"}}),
                          BorrowablePath::borrowable(writeArtifact("data")))
                      .get();
    ASSERT_EQ(result.artifactSizeBytes, 4u);

    auto stores = logs->getActivities(ActivityType::CacheStore);
    ASSERT_EQ(stores.size(), 3u);
    ASSERT_EQ(stores[0].fields, std::vector<std::string>({"multi(local, shared)", "multi", dummyRuleKey.to_string(), "//foo:bar"}));
    ASSERT_EQ(stores[0].results[0].second, std::vector<std::string>({"1", "4"}));
    ASSERT_TRUE(stores[0].stopped);

    ASSERT_EQ(stores[1].fields[0], "local");
    ASSERT_EQ(stores[1].parent, stores[0].id);
    ASSERT_EQ(stores[2].fields[0], "shared");
    ASSERT_EQ(stores[2].parent, stores[0].id) << "The borrowing store starts later but has the same parent.";
}

/* ----------------------------------------------------------------------------
 * getCacheReadMode
 * --------------------------------------------------------------------------*/

TEST_F(MultiArtifactCacheTest, readModeAggregation)
{
    auto ro = makeCache("ro", CacheReadMode::ReadOnly), pt = makeCache("pt", CacheReadMode::Passthrough),
         rw = makeCache("rw");

    ASSERT_EQ(MultiArtifactCache({pt, ro}).getCacheReadMode(), CacheReadMode::ReadOnly);
    ASSERT_EQ(MultiArtifactCache({pt}).getCacheReadMode(), CacheReadMode::Passthrough);
    ASSERT_EQ(MultiArtifactCache({ro, rw, pt}).getCacheReadMode(), CacheReadMode::ReadWrite);
    ASSERT_EQ(MultiArtifactCache({}).getCacheReadMode(), CacheReadMode::Passthrough);
}

/* ----------------------------------------------------------------------------
 * Zero caches
 * --------------------------------------------------------------------------*/

TEST_F(MultiArtifactCacheTest, emptyChainNeverHits)
{
    MultiArtifactCache multi({});

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(multi.fetch(dummyRuleKey, lazy).type, CacheResultType::Miss);
    ASSERT_EQ(
        multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("x"))).get().artifactSizeBytes,
        0u);
    ASSERT_NO_THROW(multi.close());
    ASSERT_EQ(multi.getName(), "multi()");
}

/* ----------------------------------------------------------------------------
 * close
 * --------------------------------------------------------------------------*/

TEST_F(MultiArtifactCacheTest, closeClosesEveryCache)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    MultiArtifactCache multi({cache1, cache2});

    ASSERT_EQ(multi.getName(), "multi(one, two)");

    multi.close();
    multi.close();

    ASSERT_EQ(cache1->state_.lock()->closeCalls, 1u);
    ASSERT_EQ(cache2->state_.lock()->closeCalls, 1u);
}

TEST_F(MultiArtifactCacheTest, closeFailuresAreAggregated)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two"), cache3 = makeCache("three");
    cache1->closeError = "first";
    cache3->closeError = "third";
    MultiArtifactCache multi({cache1, cache2, cache3});

    try {
        multi.close();
        FAIL() << "close should have failed";
    } catch (CacheCloseError & e) {
        std::string msg = e.what();
        ASSERT_NE(msg.find("'one': first"), std::string::npos);
        ASSERT_NE(msg.find("'three': third"), std::string::npos);
    }

    ASSERT_EQ(cache2->state_.lock()->closeCalls, 1u) << "A failing cache should not keep the others from closing.";
    ASSERT_EQ(cache3->state_.lock()->closeCalls, 1u);
}

TEST_F(MultiArtifactCacheTest, closeWaitsForPromotions)
{
    auto cache1 = makeCache("one"), cache2 = makeCache("two");
    cache2->put(dummyRuleKey, "data");
    MultiArtifactCache multi({cache1, cache2});

    auto lazy = LazyPath::ofPath(output);
    multi.fetch(dummyRuleKey, lazy);
    multi.close();

    ASSERT_TRUE(cache1->get(dummyRuleKey));
}

TEST_F(MultiArtifactCacheTest, storeAfterCloseFails)
{
    auto cache1 = makeCache("one");
    MultiArtifactCache multi({cache1});
    multi.close();

    auto fut = multi.store(ArtifactInfo({dummyRuleKey}), BorrowablePath::notBorrowable(writeArtifact("data")));
    ASSERT_THROW(fut.get(), CacheClosed);
    ASSERT_EQ(cache1->state_.lock()->storeCalls, 0u);
}

} // namespace artcache

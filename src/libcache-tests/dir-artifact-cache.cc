#include <atomic>
#include <thread>

#include <gtest/gtest.h>

#include "artcache/cache/dir-artifact-cache.hh"
#include "artcache/cache/http-binary-protocol.hh"
#include "artcache/cache/tests/capturing-logger.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

class DirArtifactCacheTest : public ::testing::Test
{
protected:
    std::filesystem::path tmpDir;
    std::unique_ptr<AutoDelete> delTmpDir;
    std::filesystem::path cacheDir;
    std::filesystem::path output;

    const RuleKey ruleKey = RuleKey::parse("abcdef0123456789");
    const RuleKey otherRuleKey = RuleKey::parse("0123456789abcdef");

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        cacheDir = tmpDir / "cache";
        output = tmpDir / "out" / "file";
    }

    std::filesystem::path writeArtifact(std::string_view contents)
    {
        auto path = tmpDir / "artifact";
        writeFile(path, contents);
        return path;
    }
};

TEST_F(DirArtifactCacheTest, fetchMiss)
{
    DirArtifactCache cache("dir", cacheDir);

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(cache.fetch(ruleKey, lazy).type, CacheResultType::Miss);
    ASSERT_FALSE(lazy.isMaterialised());
}

TEST_F(DirArtifactCacheTest, storeThenFetch)
{
    DirArtifactCache cache("dir", cacheDir);

    auto stored =
        cache.store(ArtifactInfo({ruleKey}, {{"k", "v"}}), BorrowablePath::notBorrowable(writeArtifact("hello"))).get();
    ASSERT_EQ(stored.artifactSizeBytes, 5u);
    ASSERT_TRUE(pathExists(tmpDir / "artifact"));

    auto lazy = LazyPath::ofPath(output);
    auto result = cache.fetch(ruleKey, lazy);
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.cacheSource, "dir");
    ASSERT_EQ(result.cacheMode, ArtifactCacheMode::Dir);
    ASSERT_EQ(result.metadata, StringMap({{"k", "v"}}));
    ASSERT_EQ(result.artifactSizeBytes, 5u);
    ASSERT_EQ(readFile(output), "hello");
}

TEST_F(DirArtifactCacheTest, layout)
{
    DirArtifactCache cache("dir", cacheDir);

    cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("hello"))).get();

    ASSERT_EQ(cache.artifactPath(ruleKey), cacheDir / "ab" / "abcdef0123456789");
    ASSERT_EQ(readFile(cacheDir / "ab" / "abcdef0123456789"), "hello");

    auto metadata = readFile(cacheDir / "ab" / "abcdef0123456789.metadata");
    StringSource source(metadata);
    ASSERT_EQ(ArtifactMetadataHeader::parse(source).ruleKeys, std::vector<RuleKey>({ruleKey}));
}

TEST_F(DirArtifactCacheTest, storeUnderEveryKey)
{
    DirArtifactCache cache("dir", cacheDir);

    cache.store(ArtifactInfo({ruleKey, otherRuleKey}), BorrowablePath::notBorrowable(writeArtifact("both"))).get();

    for (auto & key : {ruleKey, otherRuleKey}) {
        auto lazy = LazyPath::ofPath(tmpDir / key.to_string());
        ASSERT_EQ(cache.fetch(key, lazy).type, CacheResultType::Hit);
        ASSERT_EQ(readFile(tmpDir / key.to_string()), "both");
    }
}

TEST_F(DirArtifactCacheTest, borrowedFileIsMoved)
{
    DirArtifactCache cache("dir", cacheDir);

    cache.store(ArtifactInfo({ruleKey, otherRuleKey}), BorrowablePath::borrowable(writeArtifact("moved"))).get();

    ASSERT_FALSE(pathExists(tmpDir / "artifact"));
    ASSERT_EQ(readFile(cache.artifactPath(ruleKey)), "moved");
    ASSERT_EQ(readFile(cache.artifactPath(otherRuleKey)), "moved");
}

TEST_F(DirArtifactCacheTest, storeReplacesExistingEntry)
{
    DirArtifactCache cache("dir", cacheDir);

    cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("first"))).get();
    cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("second"))).get();

    auto lazy = LazyPath::ofPath(output);
    cache.fetch(ruleKey, lazy);
    ASSERT_EQ(readFile(output), "second");
}

TEST_F(DirArtifactCacheTest, storeIgnoresOwnReadMode)
{
    DirArtifactCache cache("dir", cacheDir, CacheReadMode::ReadOnly);

    ASSERT_EQ(cache.getCacheReadMode(), CacheReadMode::ReadOnly);
    cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("x"))).get();
    ASSERT_TRUE(pathExists(cache.artifactPath(ruleKey)));
}

TEST_F(DirArtifactCacheTest, storeMissingFileFails)
{
    DirArtifactCache cache("dir", cacheDir);

    auto fut = cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(tmpDir / "missing"));
    ASSERT_THROW(fut.get(), Error);
}

TEST_F(DirArtifactCacheTest, corruptMetadataIsAnError)
{
    DirArtifactCache cache("dir", cacheDir);

    cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("x"))).get();
    writeFile(cache.metadataPath(ruleKey), "garbage");

    auto lazy = LazyPath::ofPath(output);
    auto result = cache.fetch(ruleKey, lazy);
    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_FALSE(pathExists(output));
}

TEST_F(DirArtifactCacheTest, artifactWithoutMetadataIsMiss)
{
    DirArtifactCache cache("dir", cacheDir);

    /* What a reader sees while a store is between writing the metadata
       and the artifact of another key, or was interrupted. */
    createDirs(cache.artifactPath(ruleKey).parent_path());
    writeFile(cache.artifactPath(ruleKey), "partial");

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(cache.fetch(ruleKey, lazy).type, CacheResultType::Miss);
    ASSERT_FALSE(lazy.isMaterialised());
    ASSERT_FALSE(pathExists(output));
}

TEST_F(DirArtifactCacheTest, concurrentFetchesSeeMetadataOfEveryHit)
{
    DirArtifactCache cache("dir", cacheDir);
    auto input = writeArtifact("contents");

    std::atomic_bool storing{true};
    std::thread storer([&]() {
        for (int i = 0; i < 200; ++i) {
            auto key = RuleKey::parse(fmt("%08x", i));
            cache.store(ArtifactInfo({key}, {{targetMetadataKey, "//foo:bar"}}), BorrowablePath::notBorrowable(input))
                .get();
        }
        storing = false;
    });

    size_t errors = 0, incompleteHits = 0;
    while (storing) {
        for (int i = 0; i < 200; ++i) {
            auto out = tmpDir / "fetched";
            auto lazy = LazyPath::ofPath(out);
            auto result = cache.fetch(RuleKey::parse(fmt("%08x", i)), lazy);
            if (result.type == CacheResultType::Error)
                errors++;
            else if (
                result.type == CacheResultType::Hit
                && (result.metadata != StringMap({{targetMetadataKey, "//foo:bar"}}) || readFile(out) != "contents"))
                incompleteHits++;
        }
    }

    storer.join();

    ASSERT_EQ(errors, 0u);
    ASSERT_EQ(incompleteHits, 0u);

    for (int i = 0; i < 200; ++i) {
        auto lazy = LazyPath::ofPath(tmpDir / "fetched");
        ASSERT_EQ(cache.fetch(RuleKey::parse(fmt("%08x", i)), lazy).type, CacheResultType::Hit);
    }
}

TEST_F(DirArtifactCacheTest, storeThroughSymlink)
{
    DirArtifactCache cache("dir", cacheDir);

    auto target = tmpDir / "target";
    writeFile(target, std::string(100000, 'x'));
    auto link = tmpDir / "link";
    std::filesystem::create_symlink(target, link);

    auto stored = cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(link)).get();
    ASSERT_EQ(stored.artifactSizeBytes, 100000u);

    auto lazy = LazyPath::ofPath(output);
    auto result = cache.fetch(ruleKey, lazy);
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.artifactSizeBytes, 100000u);
    ASSERT_EQ(std::filesystem::file_size(output), 100000u);
}

TEST_F(DirArtifactCacheTest, borrowedSymlinkIsCopied)
{
    DirArtifactCache cache("dir", cacheDir);

    auto target = tmpDir / "target";
    writeFile(target, "pointed at");
    auto link = tmpDir / "link";
    std::filesystem::create_symlink(target, link);

    auto stored = cache.store(ArtifactInfo({ruleKey}), BorrowablePath::borrowable(link)).get();
    ASSERT_EQ(stored.artifactSizeBytes, 10u);

    ASSERT_FALSE(std::filesystem::is_symlink(cache.artifactPath(ruleKey)));
    ASSERT_EQ(readFile(cache.artifactPath(ruleKey)), "pointed at");
    ASSERT_EQ(readFile(target), "pointed at");
}

TEST_F(DirArtifactCacheTest, failureWarningUsesDefaultTemplate)
{
    CaptureLogs logs;
    DirArtifactCache cache("local", cacheDir);

    cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("x"))).get();
    writeFile(cache.metadataPath(ruleKey), "garbage");

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(cache.fetch(ruleKey, lazy).type, CacheResultType::Error);
    ASSERT_TRUE(logs->contains("local encountered an error: fetch(abcdef0123456789)", lvlWarn));
}

TEST_F(DirArtifactCacheTest, failureWarningUsesConfiguredTemplate)
{
    CaptureLogs logs;
    DirArtifactCache cache("local", cacheDir, CacheReadMode::ReadWrite, "<{cache_name}> {error_message} (ignored)");

    auto fut = cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(tmpDir / "missing"));
    ASSERT_THROW(fut.get(), Error);

    ASSERT_TRUE(logs->contains("<local> store(abcdef0123456789): artifact", lvlWarn));
    ASSERT_TRUE(logs->contains("(ignored)", lvlWarn));
    ASSERT_FALSE(logs->contains("encountered an error"));
}

TEST_F(DirArtifactCacheTest, fetchAndStoreAreActivities)
{
    CaptureLogs logs;
    DirArtifactCache cache("local", cacheDir);

    cache
        .store(
            ArtifactInfo({ruleKey, otherRuleKey}, {{targetMetadataKey, "//foo:bar"}}),
            BorrowablePath::notBorrowable(writeArtifact("hello")))
        .get();

    auto stores = logs->getActivities(ActivityType::CacheStore);
    ASSERT_EQ(stores.size(), 1u);
    ASSERT_TRUE(stores[0].stopped);
    ASSERT_EQ(
        stores[0].fields,
        std::vector<std::string>({"local", "dir", "abcdef0123456789,0123456789abcdef", "//foo:bar"}));
    ASSERT_EQ(stores[0].results.size(), 1u);
    ASSERT_EQ(stores[0].results[0].first, ResultType::CacheStoreResult);
    ASSERT_EQ(stores[0].results[0].second, std::vector<std::string>({"1", "5"}));

    auto lazy = LazyPath::ofPath(output);
    cache.fetch(ruleKey, lazy);
    auto lazy2 = LazyPath::ofPath(tmpDir / "other");
    cache.fetch(RuleKey::parse("ffff"), lazy2);

    auto fetches = logs->getActivities(ActivityType::CacheFetch);
    ASSERT_EQ(fetches.size(), 2u);
    ASSERT_EQ(fetches[0].fields, std::vector<std::string>({"local", "dir", "abcdef0123456789", ""}));
    ASSERT_EQ(fetches[0].results[0].second, std::vector<std::string>({"hit", "5"}));
    ASSERT_EQ(fetches[1].fields[2], "ffff");
    ASSERT_EQ(fetches[1].results[0].second, std::vector<std::string>({"miss", "0"}));
    ASSERT_TRUE(fetches[1].stopped);
}

TEST_F(DirArtifactCacheTest, storeAfterCloseFails)
{
    DirArtifactCache cache("dir", cacheDir);
    cache.close();

    auto fut = cache.store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("x")));
    ASSERT_THROW(fut.get(), CacheClosed);

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(cache.fetch(ruleKey, lazy).type, CacheResultType::Miss);
}

} // namespace artcache

#include <cstdlib>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "artcache/cache/artifact-cache-factory.hh"
#include "artcache/cache/cache-settings.hh"
#include "artcache/cache/dir-artifact-cache.hh"
#include "artcache/cache/multi-artifact-cache.hh"
#include "artcache/cache/tests/capturing-logger.hh"
#include "artcache/cache/tests/fake-http-service.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

/* ----------------------------------------------------------------------------
 * CacheSettings
 * --------------------------------------------------------------------------*/

TEST(CacheSettings, defaults)
{
    CacheSettings settings;
    ASSERT_EQ(settings.cacheTiers.get(), Strings({"dir"}));
    ASSERT_EQ(settings.dirCacheMode.get(), CacheReadMode::ReadWrite);
    ASSERT_EQ(settings.httpTimeout.get(), 3u);
    ASSERT_EQ(settings.httpConnections.get(), 25u);
    ASSERT_EQ(settings.httpMaxStoreSize.get(), 0u);
    ASSERT_EQ(settings.promotionThreads.get(), 2u);
}

TEST(CacheSettings, parsesReadMode)
{
    CacheSettings settings;
    settings.applyConfig(
        "http-cache-mode = readonly\n"
        "dir-cache-mode = passthrough\n");
    ASSERT_EQ(settings.httpCacheMode.get(), CacheReadMode::ReadOnly);
    ASSERT_EQ(settings.dirCacheMode.get(), CacheReadMode::Passthrough);
}

TEST(CacheSettings, badReadModeIsUsageError)
{
    CacheSettings settings;
    ASSERT_THROW(settings.set("http-cache-mode", "sometimes"), UsageError);
}

TEST(CacheSettings, readModeToString)
{
    CacheSettings settings;
    settings.set("dir-cache-mode", "readonly");
    auto res = settings.getSettings(/* overriddenOnly = */ true);
    ASSERT_EQ(res.size(), 1u);
    ASSERT_EQ(res["dir-cache-mode"].value, "readonly");
}

TEST(CacheSettings, readModeToJSON)
{
    CacheSettings settings;
    auto json = settings.toJSON();
    ASSERT_EQ(json["http-cache-mode"]["value"], "readwrite");
}

TEST(CacheSettings, tiersAreAppendable)
{
    CacheSettings settings;
    settings.set("extra-cache-tiers", "http");
    ASSERT_EQ(settings.cacheTiers.get(), Strings({"dir", "http"}));
}

TEST(CacheSettings, loadConfFileFromEnvironment)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);
    auto conf = tmpDir / "artcache.conf";
    writeFile(conf, "http-cache-url = http://cache.example.com\npromotion-threads = 7\n");

    setenv("ARTCACHE_CONF", conf.c_str(), 1);
    CacheSettings settings;
    loadConfFile(settings);
    unsetenv("ARTCACHE_CONF");

    ASSERT_EQ(settings.httpCacheUrl.get(), "http://cache.example.com");
    ASSERT_EQ(settings.promotionThreads.get(), 7u);
}

TEST(CacheSettings, missingConfFileIsFine)
{
    setenv("ARTCACHE_CONF", "/nonexistent/artcache.conf", 1);
    CacheSettings settings;
    ASSERT_NO_THROW(loadConfFile(settings));
    unsetenv("ARTCACHE_CONF");
}

/* ----------------------------------------------------------------------------
 * createArtifactCache
 * --------------------------------------------------------------------------*/

TEST(createArtifactCache, noTiersGivesNoopCache)
{
    CacheSettings settings;
    settings.set("cache-tiers", "");

    auto cache = createArtifactCache(settings);
    ASSERT_EQ(cache->getName(), "noop");
    ASSERT_EQ(cache->getCacheReadMode(), CacheReadMode::Passthrough);
}

TEST(createArtifactCache, unknownTier)
{
    CacheSettings settings;
    settings.set("cache-tiers", "dir s3");
    ASSERT_THROW(createArtifactCache(settings), UsageError);
}

TEST(createArtifactCache, tiersInOrder)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    CacheSettings settings;
    settings.set("cache-tiers", "http dir");
    settings.set("dir-cache-path", (tmpDir / "cache").string());
    settings.set("dir-cache-mode", "readonly");
    settings.set("http-cache-name", "remote");
    settings.set("http-cache-mode", "passthrough");

    auto service = std::make_shared<FakeHttpService>([](const RecordedRequest &) {
        return FakeHttpResponse{.status = 404, .statusMessage = "Not Found"};
    });

    auto cache = createArtifactCache(settings, service);
    ASSERT_EQ(cache->getName(), "multi(remote, dir)");
    ASSERT_EQ(cache->getCacheReadMode(), CacheReadMode::ReadOnly);

    auto multi = std::dynamic_pointer_cast<MultiArtifactCache>(cache.get_ptr());
    ASSERT_TRUE(multi);
    ASSERT_EQ(multi->getCaches()[0]->getCacheReadMode(), CacheReadMode::Passthrough);
    ASSERT_EQ(multi->getCaches()[1]->getCacheReadMode(), CacheReadMode::ReadOnly);

    auto lazy = LazyPath::ofPath(tmpDir / "out");
    ASSERT_EQ(cache->fetch(RuleKey::parse("abcd"), lazy).type, CacheResultType::Miss);
    ASSERT_EQ(service->getRequests().size(), 1u);

    cache->close();
    ASSERT_TRUE(service->isClosed());
}

TEST(createArtifactCache, dirCacheUsesConfiguredErrorTemplate)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    CaptureLogs logs;

    CacheSettings settings;
    settings.set("cache-tiers", "dir");
    settings.set("dir-cache-path", (tmpDir / "cache").string());
    settings.set("dir-cache-name", "local");
    settings.set("dir-error-message", "cache {cache_name} is unhappy: {error_message}");

    auto cache = createArtifactCache(settings);
    auto multi = std::dynamic_pointer_cast<MultiArtifactCache>(cache.get_ptr());
    ASSERT_TRUE(multi);
    auto dir = std::dynamic_pointer_cast<DirArtifactCache>(multi->getCaches()[0].get_ptr());
    ASSERT_TRUE(dir);

    auto key = RuleKey::parse("abcd");
    createDirs(dir->metadataPath(key).parent_path());
    writeFile(dir->artifactPath(key), "data");
    writeFile(dir->metadataPath(key), "garbage");

    auto lazy = LazyPath::ofPath(tmpDir / "out");
    ASSERT_EQ(cache->fetch(key, lazy).type, CacheResultType::Error);
    ASSERT_TRUE(logs->contains("cache local is unhappy: fetch(abcd)", lvlWarn));

    cache->close();
}

} // namespace artcache

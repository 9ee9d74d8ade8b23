#include <gtest/gtest.h>

#include <sys/stat.h>

#include "artcache/cache/http-artifact-cache.hh"
#include "artcache/cache/http-binary-protocol.hh"
#include "artcache/cache/tests/capturing-logger.hh"
#include "artcache/cache/tests/fake-http-service.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

class HttpArtifactCacheTest : public ::testing::Test
{
protected:
    std::filesystem::path tmpDir;
    std::unique_ptr<AutoDelete> delTmpDir;
    std::filesystem::path output;

    const RuleKey ruleKey = RuleKey::parse("00000000000000000000000000000000");
    const RuleKey otherRuleKey = RuleKey::parse("11111111111111111111111111111111");

    std::shared_ptr<FakeHttpService> service;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        output = tmpDir / "output" / "file";
    }

    std::unique_ptr<HttpArtifactCache> makeCache(FakeHttpService::Handler handler, HttpArtifactCacheParams params = {})
    {
        service = std::make_shared<FakeHttpService>(std::move(handler));
        return std::make_unique<HttpArtifactCache>(std::move(params), ref<HttpService>(service));
    }

    /**
     * A fetch response whose checksum is computed over `checksummed`
     * but which carries `data`.
     */
    static std::string createResponseBody(
        const std::vector<RuleKey> & ruleKeys, const StringMap & metadata, std::string_view checksummed, std::string_view data)
    {
        StringSource source(checksummed);
        auto block = createMetadataBlock(ArtifactMetadataHeader{ruleKeys, metadata}, source);
        StringSink sink;
        writeInt32(sink, block.size());
        sink(block);
        sink(data);
        return std::move(sink.s);
    }

    std::filesystem::path writeArtifact(std::string_view contents)
    {
        auto path = tmpDir / "artifact";
        writeFile(path, contents);
        return path;
    }
};

/* ----------------------------------------------------------------------------
 * fetch
 * --------------------------------------------------------------------------*/

TEST_F(HttpArtifactCacheTest, fetchNotFound)
{
    auto cache = makeCache([](const RecordedRequest &) {
        return FakeHttpResponse{.status = 404, .statusMessage = "Not Found", .body = "nothing here"};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Miss);
    ASSERT_FALSE(lazy.isMaterialised());
    ASSERT_FALSE(pathExists(output));
    ASSERT_EQ(service->undrainedResponses(), 0u) << "response wasn't fully read!";
}

TEST_F(HttpArtifactCacheTest, fetchOK)
{
    std::string data = "test artifact data";
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, data, data)};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Hit) << result.cacheError.value_or("");
    ASSERT_EQ(readFile(output), data);
    ASSERT_EQ(result.artifactSizeBytes, std::filesystem::file_size(output));
    ASSERT_EQ(result.cacheSource, "http");
    ASSERT_EQ(result.cacheMode, ArtifactCacheMode::Http);
    ASSERT_EQ(service->undrainedResponses(), 0u) << "response wasn't fully read!";
}

TEST_F(HttpArtifactCacheTest, fetchOverwritesExistingOutput)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "new", "new")};
    });

    createDirs(output.parent_path());
    writeFile(output, "old contents");

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(cache->fetch(ruleKey, lazy).type, CacheResultType::Hit);
    ASSERT_EQ(readFile(output), "new");
}

TEST_F(HttpArtifactCacheTest, fetchUrl)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "", "")};
    });

    auto lazy = LazyPath::ofPath(output);
    cache->fetch(ruleKey, lazy);

    auto requests = service->getRequests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_EQ(requests[0].method, HttpRequest::Method::Get);
    ASSERT_EQ(requests[0].path, "/artifacts/key/" + ruleKey.to_string());
}

TEST_F(HttpArtifactCacheTest, fetchBadChecksum)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "", "data")};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_NE(result.cacheError->find("checksum"), std::string::npos);
    ASSERT_FALSE(pathExists(output));
    ASSERT_EQ(service->undrainedResponses(), 0u) << "response wasn't fully read!";
}

TEST_F(HttpArtifactCacheTest, fetchExtraPayload)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "more data than length", "small")};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_FALSE(pathExists(output));
    ASSERT_EQ(service->undrainedResponses(), 0u) << "response wasn't fully read!";
}

TEST_F(HttpArtifactCacheTest, fetchShortPayload)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        auto body = createResponseBody({ruleKey}, {}, "data", "data");
        return FakeHttpResponse{.body = body, .contentLength = body.size() + 10};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_NE(result.cacheError->find("incorrect file size"), std::string::npos);
    ASSERT_FALSE(pathExists(output));
}

TEST_F(HttpArtifactCacheTest, fetchWithoutContentLength)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "data", "data"), .sendContentLength = false};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(readFile(output), "data");
}

TEST_F(HttpArtifactCacheTest, fetchIOException)
{
    auto cache = makeCache([](const RecordedRequest &) -> FakeHttpResponse {
        throw HttpServiceError("connection refused");
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_EQ(result.cacheSource, "http");
    ASSERT_NE(result.cacheError->find("connection refused"), std::string::npos);
    ASSERT_FALSE(pathExists(output));
}

TEST_F(HttpArtifactCacheTest, fetchServerError)
{
    auto cache = makeCache([](const RecordedRequest &) {
        return FakeHttpResponse{.status = 500, .statusMessage = "Internal Server Error", .body = "oops"};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_NE(result.cacheError->find("500"), std::string::npos);
    ASSERT_FALSE(pathExists(output));
    ASSERT_EQ(service->undrainedResponses(), 0u);
}

TEST_F(HttpArtifactCacheTest, fetchMalformedBlock)
{
    auto cache = makeCache([](const RecordedRequest &) { return FakeHttpResponse{.body = "\x7f\xff"}; });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_FALSE(pathExists(output));
}

TEST_F(HttpArtifactCacheTest, fetchWrongKey)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({otherRuleKey}, {}, "data", "data")};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_FALSE(pathExists(output));
    ASSERT_EQ(service->undrainedResponses(), 0u);
}

TEST_F(HttpArtifactCacheTest, fetchAnyOfSeveralKeys)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({otherRuleKey, ruleKey}, {}, "data", "data")};
    });

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(cache->fetch(ruleKey, lazy).type, CacheResultType::Hit);
}

TEST_F(HttpArtifactCacheTest, fetchMetadata)
{
    StringMap metadata{{"some", "metadata"}};
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, metadata, "data", "data")};
    });

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.metadata, metadata);
}

TEST_F(HttpArtifactCacheTest, fetchOutputPathFailurePropagates)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "data", "data")};
    });

    LazyPath lazy([]() -> std::filesystem::path { throw Error("read-only file system"); });
    ASSERT_THROW(cache->fetch(ruleKey, lazy), OutputPathError);
}

TEST_F(HttpArtifactCacheTest, fetchedFileHonoursUmask)
{
    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "data", "data")};
    });

    auto mask = umask(0);
    umask(mask);

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Hit);
    struct stat st;
    ASSERT_EQ(stat(output.c_str(), &st), 0);
    ASSERT_EQ(st.st_mode & 0777, 0666 & ~mask);

    /* What a file created by the process itself gets. */
    auto reference = tmpDir / "reference";
    writeFile(reference, "");
    struct stat refSt;
    ASSERT_EQ(stat(reference.c_str(), &refSt), 0);
    ASSERT_EQ(st.st_mode & 0777, refSt.st_mode & 0777);
}

TEST_F(HttpArtifactCacheTest, missThenHitOnceStored)
{
    InMemoryHttpServer server;
    auto cache = makeCache(server.handler());

    auto lazy = LazyPath::ofPath(output);
    ASSERT_EQ(cache->fetch(ruleKey, lazy).type, CacheResultType::Miss);
    ASSERT_FALSE(lazy.isMaterialised());

    cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("late"))).get();

    auto lazy2 = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy2);
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(readFile(output), "late");
    ASSERT_EQ(service->getRequests().size(), 3u);
    ASSERT_EQ(service->undrainedResponses(), 0u);
}

TEST_F(HttpArtifactCacheTest, fetchIsAnActivity)
{
    CaptureLogs logs;

    auto cache = makeCache([&](const RecordedRequest &) {
        return FakeHttpResponse{.body = createResponseBody({ruleKey}, {}, "data", "data")};
    });

    auto lazy = LazyPath::ofPath(output);
    cache->fetch(ruleKey, lazy);

    auto fetches = logs->getActivities(ActivityType::CacheFetch);
    ASSERT_EQ(fetches.size(), 1u);
    ASSERT_EQ(fetches[0].fields, std::vector<std::string>({"http", "http", ruleKey.to_string(), ""}));
    ASSERT_EQ(fetches[0].results.size(), 1u);
    ASSERT_EQ(fetches[0].results[0].first, ResultType::CacheFetchResult);
    ASSERT_EQ(fetches[0].results[0].second, std::vector<std::string>({"hit", "4"}));
    ASSERT_TRUE(fetches[0].stopped);
}

TEST_F(HttpArtifactCacheTest, errorTextReplaced)
{
    CaptureLogs logs;

    auto cache = makeCache(
        [&](const RecordedRequest &) {
            return FakeHttpResponse{.body = createResponseBody({otherRuleKey}, {}, "data", "data")};
        },
        HttpArtifactCacheParams{.name = "http cache"});

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);

    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_TRUE(logs->contains("http cache encountered an error: "));
    ASSERT_TRUE(logs->contains("incorrect key name"));
}

TEST_F(HttpArtifactCacheTest, customErrorTemplate)
{
    CaptureLogs logs;

    auto cache = makeCache(
        [](const RecordedRequest &) -> FakeHttpResponse { throw HttpServiceError("timed out"); },
        HttpArtifactCacheParams{.name = "remote", .errorMessageFormat = "[{cache_name}] {error_message} (ignored)"});

    auto lazy = LazyPath::ofPath(output);
    cache->fetch(ruleKey, lazy);

    ASSERT_TRUE(logs->contains("[remote] fetch(" + ruleKey.to_string() + "): timed out (ignored)"));
}

/* ----------------------------------------------------------------------------
 * store
 * --------------------------------------------------------------------------*/

TEST_F(HttpArtifactCacheTest, store)
{
    std::string data = "data";
    std::atomic_bool hasCalled = false;

    auto cache = makeCache([&](const RecordedRequest & request) {
        hasCalled = true;
        EXPECT_EQ(request.method, HttpRequest::Method::Post);
        EXPECT_EQ(request.path, "/artifacts/key/" + ruleKey.to_string());
        EXPECT_EQ(request.contentType, "application/octet-stream");
        EXPECT_EQ(request.contentLength, request.body.size());

        StringSource source(request.body);
        StringSink payload;
        auto stored = readStoreRequest(source, payload);
        EXPECT_EQ(stored.ruleKeys, std::vector<RuleKey>({ruleKey}));
        EXPECT_EQ(payload.s, data);
        EXPECT_EQ(stored.metadataAndPayload.actualChecksum, stored.metadataAndPayload.block.expectedChecksum);

        return FakeHttpResponse{.status = 202, .statusMessage = "Accepted"};
    });

    auto result = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact(data))).get();

    ASSERT_TRUE(hasCalled);
    ASSERT_EQ(result.artifactSizeBytes, data.size());
    ASSERT_TRUE(pathExists(tmpDir / "artifact"));
}

TEST_F(HttpArtifactCacheTest, storeIOException)
{
    auto cache = makeCache([](const RecordedRequest &) -> FakeHttpResponse {
        throw HttpServiceError("connection reset");
    });

    auto fut = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("data")));
    ASSERT_THROW(fut.get(), HttpServiceError);
}

TEST_F(HttpArtifactCacheTest, storeServerError)
{
    CaptureLogs logs;

    auto cache = makeCache([](const RecordedRequest &) {
        return FakeHttpResponse{.status = 503, .statusMessage = "Service Unavailable"};
    });

    auto fut = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("data")));
    try {
        fut.get();
        FAIL() << "store should have failed";
    } catch (HttpStatusError & e) {
        ASSERT_EQ(e.status, 503u);
    }
    ASSERT_TRUE(logs->contains("http encountered an error: store(" + ruleKey.to_string()));
}

TEST_F(HttpArtifactCacheTest, storeMultipleKeys)
{
    InMemoryHttpServer server;
    auto cache = makeCache(server.handler());

    auto ruleKey1 = RuleKey::parse("1111111111111111111111111111111111111111");
    auto ruleKey2 = RuleKey::parse("2222222222222222222222222222222222222222");

    cache->store(ArtifactInfo({ruleKey1, ruleKey2}), BorrowablePath::notBorrowable(writeArtifact("data"))).get();

    auto requests = service->getRequests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_EQ(requests[0].path, "/artifacts/key/" + ruleKey1.to_string());
    ASSERT_TRUE(server.get(ruleKey1));
    ASSERT_TRUE(server.get(ruleKey2));
    ASSERT_EQ(server.get(ruleKey2)->payload, "data");
}

TEST_F(HttpArtifactCacheTest, storeThenFetch)
{
    InMemoryHttpServer server;
    auto cache = makeCache(server.handler());

    cache
        ->store(
            ArtifactInfo({ruleKey}, {{"build", "42"}}), BorrowablePath::notBorrowable(writeArtifact("round trip")))
        .get();

    auto lazy = LazyPath::ofPath(output);
    auto result = cache->fetch(ruleKey, lazy);
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.metadata, StringMap({{"build", "42"}}));
    ASSERT_EQ(readFile(output), "round trip");
}

TEST_F(HttpArtifactCacheTest, storeSkipsOversizedArtifacts)
{
    auto cache =
        makeCache([](const RecordedRequest &) { return FakeHttpResponse{}; }, HttpArtifactCacheParams{.maxStoreSize = 3});

    auto result = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("12345"))).get();

    ASSERT_EQ(result.artifactSizeBytes, 0u);
    ASSERT_TRUE(service->getRequests().empty());
}

TEST_F(HttpArtifactCacheTest, storeSizeLimitFollowsSymlinks)
{
    auto cache =
        makeCache([](const RecordedRequest &) { return FakeHttpResponse{}; }, HttpArtifactCacheParams{.maxStoreSize = 1000});

    auto target = tmpDir / "target";
    writeFile(target, std::string(100000, 'x'));
    auto link = tmpDir / "link";
    std::filesystem::create_symlink(target, link);

    auto result = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(link)).get();

    ASSERT_EQ(result.artifactSizeBytes, 0u);
    ASSERT_TRUE(service->getRequests().empty());
}

TEST_F(HttpArtifactCacheTest, storeThroughSymlinkUploadsTarget)
{
    InMemoryHttpServer server;
    auto cache = makeCache(server.handler(), HttpArtifactCacheParams{.maxStoreSize = 1000});

    auto target = tmpDir / "target";
    writeFile(target, std::string(500, 'x'));
    auto link = tmpDir / "link";
    std::filesystem::create_symlink(target, link);

    auto result = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(link)).get();

    ASSERT_EQ(result.artifactSizeBytes, 500u);
    ASSERT_TRUE(server.get(ruleKey));
    ASSERT_EQ(server.get(ruleKey)->payload, std::string(500, 'x'));
}

TEST_F(HttpArtifactCacheTest, storingTwiceIsHarmless)
{
    InMemoryHttpServer server;
    auto cache = makeCache(server.handler());

    ArtifactInfo info({ruleKey, otherRuleKey}, {{"build", "42"}});
    auto path = writeArtifact("same bytes");

    auto first = cache->store(info, BorrowablePath::notBorrowable(path)).get();
    auto second = cache->store(info, BorrowablePath::notBorrowable(path)).get();
    ASSERT_EQ(first.artifactSizeBytes, second.artifactSizeBytes);
    ASSERT_EQ(server.size(), 2u);

    for (auto & key : {ruleKey, otherRuleKey}) {
        auto lazy = LazyPath::ofPath(tmpDir / key.to_string());
        auto result = cache->fetch(key, lazy);
        ASSERT_EQ(result.type, CacheResultType::Hit);
        ASSERT_EQ(result.metadata, StringMap({{"build", "42"}}));
        ASSERT_EQ(readFile(tmpDir / key.to_string()), "same bytes");
    }
}

TEST_F(HttpArtifactCacheTest, storeIsAnActivityUntilUploaded)
{
    CaptureLogs logs;

    InMemoryHttpServer server;
    auto cache = makeCache(server.handler());

    cache
        ->store(
            ArtifactInfo({ruleKey, otherRuleKey}, {{targetMetadataKey, "//foo:bar"}}),
            BorrowablePath::notBorrowable(writeArtifact("data")))
        .get();

    auto stores = logs->getActivities(ActivityType::CacheStore);
    ASSERT_EQ(stores.size(), 1u);
    ASSERT_EQ(
        stores[0].fields,
        std::vector<std::string>(
            {"http", "http", ruleKey.to_string() + "," + otherRuleKey.to_string(), "//foo:bar"}));
    ASSERT_TRUE(stores[0].stopped);
    ASSERT_EQ(stores[0].results.size(), 1u);
    ASSERT_EQ(stores[0].results[0].second, std::vector<std::string>({"1", "4"}));
}

TEST_F(HttpArtifactCacheTest, failedStoreActivityReportsFailure)
{
    CaptureLogs logs;

    auto cache = makeCache([](const RecordedRequest &) {
        return FakeHttpResponse{.status = 503, .statusMessage = "Service Unavailable"};
    });

    auto fut = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("data")));
    ASSERT_THROW(fut.get(), HttpStatusError);

    auto stores = logs->getActivities(ActivityType::CacheStore);
    ASSERT_EQ(stores.size(), 1u);
    ASSERT_TRUE(stores[0].stopped);
    ASSERT_EQ(stores[0].results[0].second, std::vector<std::string>({"0", "0"}));
}

TEST_F(HttpArtifactCacheTest, storeMissingFileFails)
{
    auto cache = makeCache([](const RecordedRequest &) { return FakeHttpResponse{}; });

    auto fut = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(tmpDir / "missing"));
    ASSERT_THROW(fut.get(), Error);
    ASSERT_TRUE(service->getRequests().empty());
}

TEST_F(HttpArtifactCacheTest, storeNeverDeletesBorrowedFile)
{
    auto cache = makeCache([](const RecordedRequest &) { return FakeHttpResponse{}; });

    cache->store(ArtifactInfo({ruleKey}), BorrowablePath::borrowable(writeArtifact("data"))).get();
    ASSERT_TRUE(pathExists(tmpDir / "artifact"));
}

/* ----------------------------------------------------------------------------
 * close
 * --------------------------------------------------------------------------*/

TEST_F(HttpArtifactCacheTest, closeFinishesQueuedStores)
{
    InMemoryHttpServer server;
    auto cache = makeCache(server.handler(), HttpArtifactCacheParams{.storeThreads = 1});

    std::vector<std::future<StoreResult>> futures;
    for (int i = 0; i < 10; i++) {
        auto path = tmpDir / fmt("artifact-%d", i);
        writeFile(path, fmt("data %d", i));
        futures.push_back(
            cache->store(ArtifactInfo({RuleKey::parse(fmt("%02x", i))}), BorrowablePath::notBorrowable(path)));
    }

    cache->close();

    for (auto & fut : futures)
        ASSERT_NO_THROW(fut.get());
    ASSERT_EQ(server.size(), 10u);
    ASSERT_TRUE(service->isClosed());
}

TEST_F(HttpArtifactCacheTest, storeAfterCloseFails)
{
    auto cache = makeCache([](const RecordedRequest &) { return FakeHttpResponse{}; });
    cache->close();

    auto fut = cache->store(ArtifactInfo({ruleKey}), BorrowablePath::notBorrowable(writeArtifact("data")));
    ASSERT_THROW(fut.get(), CacheClosed);
    ASSERT_TRUE(service->getRequests().empty());
}

TEST_F(HttpArtifactCacheTest, closeIsIdempotent)
{
    auto cache = makeCache([](const RecordedRequest &) { return FakeHttpResponse{}; });
    cache->close();
    ASSERT_NO_THROW(cache->close());
}

TEST_F(HttpArtifactCacheTest, reportsReadMode)
{
    auto cache = makeCache(
        [](const RecordedRequest &) { return FakeHttpResponse{}; },
        HttpArtifactCacheParams{.readMode = CacheReadMode::ReadOnly});
    ASSERT_EQ(cache->getCacheReadMode(), CacheReadMode::ReadOnly);
    ASSERT_EQ(cache->getName(), "http");
}

} // namespace artcache

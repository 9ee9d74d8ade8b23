#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "artcache/cache/cache-read-mode.hh"
#include "artcache/cache/cache-result.hh"
#include "artcache/util/error.hh"

namespace artcache {

/* ----------------------------------------------------------------------------
 * CacheReadMode
 * --------------------------------------------------------------------------*/

TEST(CacheReadMode, parse)
{
    ASSERT_EQ(parseCacheReadMode("readwrite"), CacheReadMode::ReadWrite);
    ASSERT_EQ(parseCacheReadMode("readonly"), CacheReadMode::ReadOnly);
    ASSERT_EQ(parseCacheReadMode("passthrough"), CacheReadMode::Passthrough);
    ASSERT_EQ(parseCacheReadMode("READWRITE"), std::nullopt);
    ASSERT_EQ(parseCacheReadMode(""), std::nullopt);
}

TEST(CacheReadMode, show)
{
    ASSERT_EQ(showCacheReadMode(CacheReadMode::ReadWrite), "readwrite");
    ASSERT_EQ(showCacheReadMode(CacheReadMode::ReadOnly), "readonly");
    ASSERT_EQ(showCacheReadMode(CacheReadMode::Passthrough), "passthrough");
}

TEST(CacheReadMode, onlyReadWriteIsWritable)
{
    ASSERT_TRUE(isWritable(CacheReadMode::ReadWrite));
    ASSERT_FALSE(isWritable(CacheReadMode::ReadOnly));
    ASSERT_FALSE(isWritable(CacheReadMode::Passthrough));
}

TEST(CacheReadMode, json)
{
    nlohmann::json json = CacheReadMode::ReadOnly;
    ASSERT_EQ(json, "readonly");
    ASSERT_EQ(json.get<CacheReadMode>(), CacheReadMode::ReadOnly);
    ASSERT_THROW(nlohmann::json("sometimes").get<CacheReadMode>(), Error);
}

/* ----------------------------------------------------------------------------
 * CacheResult
 * --------------------------------------------------------------------------*/

TEST(CacheResult, hit)
{
    auto result = CacheResult::hit("dir", ArtifactCacheMode::Dir, {{"k", "v"}}, 42);
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.type, CacheResultType::Hit);
    ASSERT_EQ(result.cacheSource, "dir");
    ASSERT_EQ(result.metadata, StringMap({{"k", "v"}}));
    ASSERT_EQ(result.artifactSizeBytes, 42u);
    ASSERT_EQ(result.cacheError, std::nullopt);
}

TEST(CacheResult, miss)
{
    auto result = CacheResult::miss();
    ASSERT_FALSE(result.isSuccess());
    ASSERT_EQ(result.type, CacheResultType::Miss);
    ASSERT_EQ(result.cacheSource, std::nullopt);
    ASSERT_TRUE(result.metadata.empty());
    ASSERT_EQ(result.artifactSizeBytes, std::nullopt);
}

TEST(CacheResult, error)
{
    auto result = CacheResult::error("http", ArtifactCacheMode::Http, "connection refused");
    ASSERT_FALSE(result.isSuccess());
    ASSERT_EQ(result.type, CacheResultType::Error);
    ASSERT_EQ(result.cacheError, "connection refused");
    ASSERT_EQ(result.to_string(), "error from 'http': connection refused");
}

TEST(CacheResult, toJSON)
{
    nlohmann::json json = CacheResult::hit("http", ArtifactCacheMode::Http, {{"k", "v"}}, 3);
    ASSERT_EQ(
        json,
        nlohmann::json::parse(R"({
            "type": "hit",
            "cacheMode": "http",
            "cacheSource": "http",
            "cacheError": null,
            "metadata": {"k": "v"},
            "artifactSizeBytes": 3
        })"));
}

TEST(CacheResult, missToJSON)
{
    nlohmann::json json = CacheResult::miss();
    ASSERT_EQ(json["type"], "miss");
    ASSERT_TRUE(json["cacheSource"].is_null());
}

} // namespace artcache

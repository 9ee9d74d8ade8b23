#pragma once
///@file

#include "artcache/cache/cache-read-mode.hh"
#include "artcache/util/configuration.hh"

namespace artcache {

template<>
CacheReadMode BaseSetting<CacheReadMode>::parse(const std::string & str) const;
template<>
std::string BaseSetting<CacheReadMode>::to_string() const;

struct CacheSettings : public Config
{
    CacheSettings();

    ~CacheSettings();

    Setting<Strings> cacheTiers{
        this,
        {"dir"},
        "cache-tiers",
        R"(
          The caches to consult, fastest first. Each is `dir` or `http`.
        )"};

    PathSetting dirCachePath{this, "buck-out/cache", "dir-cache-path", "The directory of the `dir` cache."};

    Setting<CacheReadMode> dirCacheMode{
        this,
        CacheReadMode::ReadWrite,
        "dir-cache-mode",
        R"(
          Whether builds store artifacts in the `dir` cache: `readwrite`,
          `readonly` or `passthrough`.
        )"};

    Setting<std::string> dirCacheName{this, "dir", "dir-cache-name", "The name of the `dir` cache in messages."};

    Setting<std::string> dirErrorMessage{
        this,
        "{cache_name} encountered an error: {error_message}",
        "dir-error-message",
        R"(
          The warning printed when reading from or writing to the `dir`
          cache fails. `{cache_name}` and `{error_message}` are replaced.
        )"};

    Setting<std::string> httpCacheUrl{
        this, "http://localhost:8080", "http-cache-url", "The base URL of the `http` cache."};

    Setting<CacheReadMode> httpCacheMode{
        this,
        CacheReadMode::ReadWrite,
        "http-cache-mode",
        R"(
          Whether builds store artifacts in the `http` cache: `readwrite`,
          `readonly` or `passthrough`.
        )"};

    Setting<std::string> httpCacheName{this, "http", "http-cache-name", "The name of the `http` cache in messages."};

    Setting<unsigned long> httpTimeout{
        this,
        3,
        "http-timeout",
        R"(
          The timeout (in seconds) for connecting to the `http` cache, and
          after which a stalled transfer is abandoned.
        )"};

    Setting<size_t> httpConnections{
        this, 25, "http-connections", "The maximum number of idle connections kept to the `http` cache."};

    Setting<size_t> httpStoreThreads{
        this, 4, "http-store-threads", "The number of threads uploading artifacts to the `http` cache."};

    Setting<uint64_t> httpMaxStoreSize{
        this,
        0,
        "http-max-store-size",
        R"(
          Artifacts larger than this many bytes are not uploaded to the
          `http` cache. 0 means no limit.
        )"};

    Setting<std::string> httpErrorMessage{
        this,
        "{cache_name} encountered an error: {error_message}",
        "http-error-message",
        R"(
          The warning printed when a request to the `http` cache fails.
          `{cache_name}` and `{error_message}` are replaced.
        )"};

    Setting<size_t> promotionThreads{
        this, 2, "promotion-threads", "The number of threads copying hits into faster caches."};
};

/**
 * Apply the configuration file named by `$ARTCACHE_CONF`, or
 * `artcache.conf` in the current directory. A missing file is not an
 * error.
 */
void loadConfFile(Config & config);

} // namespace artcache

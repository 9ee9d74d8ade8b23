#include "artcache/cache/artifact-cache-factory.hh"
#include "artcache/cache/dir-artifact-cache.hh"
#include "artcache/cache/http-artifact-cache.hh"
#include "artcache/cache/multi-artifact-cache.hh"
#include "artcache/cache/noop-artifact-cache.hh"
#include "artcache/util/logging.hh"
#include "artcache/util/strings.hh"

namespace artcache {

ref<ArtifactCache> createArtifactCache(const CacheSettings & settings, std::shared_ptr<HttpService> httpService)
{
    auto & tiers = settings.cacheTiers.get();

    if (tiers.empty()) {
        debug("no cache tiers configured");
        return make_ref<NoopArtifactCache>();
    }

    std::vector<ref<ArtifactCache>> caches;

    for (auto & tier : tiers) {
        if (tier == "dir")
            caches.push_back(make_ref<DirArtifactCache>(
                settings.dirCacheName.get(),
                settings.dirCachePath.get(),
                settings.dirCacheMode.get(),
                settings.dirErrorMessage.get()));
        else if (tier == "http") {
            auto service = httpService ? ref<HttpService>(httpService)
                                       : makeCurlHttpService(
                                             settings.httpCacheUrl.get(),
                                             CurlHttpServiceSettings{
                                                 .timeout = settings.httpTimeout.get(),
                                                 .maxConnections = settings.httpConnections.get(),
                                             });
            caches.push_back(make_ref<HttpArtifactCache>(
                HttpArtifactCacheParams{
                    .name = settings.httpCacheName.get(),
                    .readMode = settings.httpCacheMode.get(),
                    .errorMessageFormat = settings.httpErrorMessage.get(),
                    .storeThreads = settings.httpStoreThreads.get(),
                    .maxStoreSize = settings.httpMaxStoreSize.get(),
                },
                service));
        } else
            throw UsageError("unknown cache tier '%s' in 'cache-tiers' (expected 'dir' or 'http')", tier);
    }

    debug("using cache tiers %s", concatStringsSep(", ", tiers));

    return make_ref<MultiArtifactCache>(std::move(caches), settings.promotionThreads.get());
}

} // namespace artcache

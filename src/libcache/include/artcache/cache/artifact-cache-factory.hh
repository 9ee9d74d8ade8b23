#pragma once
///@file

#include "artcache/cache/artifact-cache.hh"
#include "artcache/cache/cache-settings.hh"
#include "artcache/cache/http-service.hh"

namespace artcache {

/**
 * Build the caches named by `cache-tiers`, in order, chained into a
 * MultiArtifactCache. With no tiers the result never hits.
 *
 * @param httpService Transport of the `http` tier. A libcurl client
 * for `http-cache-url` is used if none is given.
 *
 * @throws UsageError on an unknown tier name.
 */
ref<ArtifactCache> createArtifactCache(const CacheSettings & settings, std::shared_ptr<HttpService> httpService = nullptr);

} // namespace artcache

#include "artcache/cache/artifact-cache.hh"
#include "artcache/util/strings.hh"

namespace artcache {

std::future<StoreResult> ArtifactCache::store(const ArtifactInfo & info, const BorrowablePath & output)
{
    auto promise = std::make_shared<std::promise<StoreResult>>();
    auto future = promise->get_future();
    store(info, output, {[promise](std::future<StoreResult> result) {
              try {
                  promise->set_value(result.get());
              } catch (...) {
                  promise->set_exception(std::current_exception());
              }
          }});
    return future;
}

Logger::Fields cacheActivityFields(
    std::string_view cacheName, std::string_view kind, const std::vector<RuleKey> & keys, const StringMap & metadata)
{
    Strings hexKeys;
    for (auto & key : keys)
        hexKeys.push_back(key.to_string());

    auto target = metadata.find(targetMetadataKey);

    return {
        std::string(cacheName),
        std::string(kind),
        concatStringsSep(",", hexKeys),
        target != metadata.end() ? target->second : "",
    };
}

void warnCacheFailure(std::string_view format, std::string_view cacheName, std::string_view errorMessage)
{
    auto msg = replaceStrings(std::string(format), "{cache_name}", cacheName);
    msg = replaceStrings(msg, "{error_message}", errorMessage);
    logger->warn(msg);
}

} // namespace artcache

#include "artcache/cache/cache-result.hh"
#include "artcache/util/error.hh"
#include "artcache/util/fmt.hh"

#include <nlohmann/json.hpp>

namespace artcache {

NLOHMANN_JSON_SERIALIZE_ENUM(
    CacheResultType,
    {
        {CacheResultType::Miss, "miss"},
        {CacheResultType::Hit, "hit"},
        {CacheResultType::Error, "error"},
    });

NLOHMANN_JSON_SERIALIZE_ENUM(
    ArtifactCacheMode,
    {
        {ArtifactCacheMode::Dir, "dir"},
        {ArtifactCacheMode::Http, "http"},
    });

std::string_view showCacheResultType(CacheResultType type)
{
    switch (type) {
    case CacheResultType::Miss:
        return "miss";
    case CacheResultType::Hit:
        return "hit";
    case CacheResultType::Error:
        return "error";
    }
    unreachable();
}

std::string_view showArtifactCacheMode(ArtifactCacheMode mode)
{
    switch (mode) {
    case ArtifactCacheMode::Dir:
        return "dir";
    case ArtifactCacheMode::Http:
        return "http";
    }
    unreachable();
}

CacheResult CacheResult::hit(
    std::string cacheSource, std::optional<ArtifactCacheMode> cacheMode, StringMap metadata, uint64_t artifactSizeBytes)
{
    return CacheResult{
        .type = CacheResultType::Hit,
        .cacheMode = cacheMode,
        .cacheSource = std::move(cacheSource),
        .metadata = std::move(metadata),
        .artifactSizeBytes = artifactSizeBytes,
    };
}

CacheResult CacheResult::miss()
{
    return CacheResult{.type = CacheResultType::Miss};
}

CacheResult
CacheResult::error(std::string cacheSource, std::optional<ArtifactCacheMode> cacheMode, std::string cacheError)
{
    return CacheResult{
        .type = CacheResultType::Error,
        .cacheMode = cacheMode,
        .cacheSource = std::move(cacheSource),
        .cacheError = std::move(cacheError),
    };
}

std::string CacheResult::to_string() const
{
    switch (type) {
    case CacheResultType::Miss:
        return "miss";
    case CacheResultType::Hit:
        return fmt("hit from '%s' (%d bytes)", cacheSource.value_or("?"), artifactSizeBytes.value_or(0));
    case CacheResultType::Error:
        return fmt("error from '%s': %s", cacheSource.value_or("?"), cacheError.value_or(""));
    }
    unreachable();
}

void to_json(nlohmann::json & json, const CacheResult & result)
{
    json = nlohmann::json::object();
    json["type"] = result.type;
    json["cacheMode"] = result.cacheMode ? nlohmann::json(*result.cacheMode) : nlohmann::json(nullptr);
    json["cacheSource"] = result.cacheSource ? nlohmann::json(*result.cacheSource) : nlohmann::json(nullptr);
    json["cacheError"] = result.cacheError ? nlohmann::json(*result.cacheError) : nlohmann::json(nullptr);
    json["metadata"] = result.metadata;
    json["artifactSizeBytes"] =
        result.artifactSizeBytes ? nlohmann::json(*result.artifactSizeBytes) : nlohmann::json(nullptr);
}

} // namespace artcache

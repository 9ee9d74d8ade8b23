#pragma once
///@file

#include "artcache/util/types.hh"

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace artcache {

enum class CacheResultType {
    Miss,
    Hit,
    Error,
};

std::string_view showCacheResultType(CacheResultType type);

/**
 * The family of backend that produced a result.
 */
enum class ArtifactCacheMode {
    Dir,
    Http,
};

std::string_view showArtifactCacheMode(ArtifactCacheMode mode);

/**
 * The outcome of a fetch.
 *
 * A hit always carries the artifact's metadata (possibly empty) and
 * size. Misses and errors never leave anything at the destination.
 */
struct CacheResult
{
    CacheResultType type;

    std::optional<ArtifactCacheMode> cacheMode;

    /**
     * Display name of the backend that answered.
     */
    std::optional<std::string> cacheSource;

    std::optional<std::string> cacheError;

    StringMap metadata;

    std::optional<uint64_t> artifactSizeBytes;

    static CacheResult hit(
        std::string cacheSource,
        std::optional<ArtifactCacheMode> cacheMode,
        StringMap metadata,
        uint64_t artifactSizeBytes);

    static CacheResult miss();

    static CacheResult
    error(std::string cacheSource, std::optional<ArtifactCacheMode> cacheMode, std::string cacheError);

    bool isSuccess() const
    {
        return type == CacheResultType::Hit;
    }

    std::string to_string() const;
};

void to_json(nlohmann::json & json, const CacheResult & result);

} // namespace artcache

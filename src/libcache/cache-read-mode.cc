#include "artcache/cache/cache-read-mode.hh"
#include "artcache/util/error.hh"

#include <nlohmann/json.hpp>

namespace artcache {

std::string_view showCacheReadMode(CacheReadMode mode)
{
    switch (mode) {
    case CacheReadMode::ReadWrite:
        return "readwrite";
    case CacheReadMode::ReadOnly:
        return "readonly";
    case CacheReadMode::Passthrough:
        return "passthrough";
    }
    unreachable();
}

std::optional<CacheReadMode> parseCacheReadMode(std::string_view s)
{
    if (s == "readwrite")
        return CacheReadMode::ReadWrite;
    if (s == "readonly")
        return CacheReadMode::ReadOnly;
    if (s == "passthrough")
        return CacheReadMode::Passthrough;
    return std::nullopt;
}

void to_json(nlohmann::json & json, CacheReadMode mode)
{
    json = std::string(showCacheReadMode(mode));
}

void from_json(const nlohmann::json & json, CacheReadMode & mode)
{
    auto s = json.get<std::string>();
    if (auto m = parseCacheReadMode(s))
        mode = *m;
    else
        throw Error("invalid cache read mode '%s'", s);
}

} // namespace artcache

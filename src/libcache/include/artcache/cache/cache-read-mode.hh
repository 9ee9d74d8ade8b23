#pragma once
///@file

#include <optional>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace artcache {

/**
 * Whether a cache takes part in explicit store calls. Fetches are
 * never affected, and neither are promotions between tiers.
 */
enum class CacheReadMode {
    ReadWrite,
    ReadOnly,
    Passthrough,
};

std::string_view showCacheReadMode(CacheReadMode mode);

/**
 * Parse the configuration spelling: `readwrite`, `readonly` or
 * `passthrough`.
 */
std::optional<CacheReadMode> parseCacheReadMode(std::string_view s);

inline bool isWritable(CacheReadMode mode)
{
    return mode == CacheReadMode::ReadWrite;
}

void to_json(nlohmann::json & json, CacheReadMode mode);
void from_json(const nlohmann::json & json, CacheReadMode & mode);

} // namespace artcache

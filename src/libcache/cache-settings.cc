#include "artcache/cache/cache-settings.hh"
#include "artcache/util/config-impl.hh"
#include "artcache/util/file-system.hh"
#include "artcache/util/logging.hh"

#include <nlohmann/json.hpp>

namespace artcache {

CacheSettings::CacheSettings() {}

CacheSettings::~CacheSettings() {}

template<>
CacheReadMode BaseSetting<CacheReadMode>::parse(const std::string & str) const
{
    if (auto mode = parseCacheReadMode(str))
        return *mode;
    throw UsageError("option '%s' has invalid value '%s'", name, str);
}

template<>
std::string BaseSetting<CacheReadMode>::to_string() const
{
    return std::string(showCacheReadMode(value));
}

template class BaseSetting<CacheReadMode>;

void loadConfFile(Config & config)
{
    auto env = getenv("ARTCACHE_CONF");
    Path path = env && *env ? env : "artcache.conf";

    if (!pathExists(path)) {
        debug("configuration file '%s' does not exist", path);
        return;
    }

    try {
        config.applyConfig(readFile(path), path);
    } catch (Error & e) {
        e.addTrace("while loading configuration file '%s'", path);
        throw;
    }
}

} // namespace artcache

#pragma once
///@file

#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace artcache {

typedef std::list<std::string> Strings;

/**
 * Ordered string map with a transparent comparator, so lookups by
 * `std::string_view` don't allocate.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

using StringSet = std::set<std::string, std::less<>>;

typedef std::vector<std::pair<std::string, std::string>> Headers;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;

} // namespace artcache

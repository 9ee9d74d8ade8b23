#pragma once
///@file

#include "artcache/util/error.hh"

#include <compare>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace artcache {

MakeError(BadRuleKey, Error);

/**
 * The key under which a build step's output is cached: a
 * deterministic hash of everything that went into the step, computed
 * by the build engine.
 *
 * Keys are kept in their canonical textual form, lowercase hex, which
 * is also how they travel on the wire and appear in cache URLs.
 */
class RuleKey
{
    std::string hex;

    explicit RuleKey(std::string hex)
        : hex(std::move(hex))
    {
    }

public:

    /**
     * Parse a key from a non-empty, even-length string of hex digits
     * in either case.
     *
     * @throws BadRuleKey
     */
    static RuleKey parse(std::string_view s);

    const std::string & to_string() const
    {
        return hex;
    }

    bool operator==(const RuleKey &) const = default;
    auto operator<=>(const RuleKey &) const = default;
};

std::ostream & operator<<(std::ostream & str, const RuleKey & key);

void to_json(nlohmann::json & json, const RuleKey & key);

} // namespace artcache

template<>
struct std::hash<artcache::RuleKey>
{
    std::size_t operator()(const artcache::RuleKey & key) const noexcept
    {
        return std::hash<std::string>{}(key.to_string());
    }
};

#include "artcache/cache/rule-key.hh"
#include "artcache/util/strings.hh"

#include <nlohmann/json.hpp>

#include <cctype>
#include <ostream>

namespace artcache {

RuleKey RuleKey::parse(std::string_view s)
{
    if (s.empty())
        throw BadRuleKey("rule key must not be empty");
    if (s.size() % 2)
        throw BadRuleKey("rule key '%s' has an odd number of hex digits", s);
    for (auto c : s)
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            throw BadRuleKey("rule key '%s' contains the non-hex character '%c'", s, c);
    return RuleKey(toLower(std::string(s)));
}

std::ostream & operator<<(std::ostream & str, const RuleKey & key)
{
    return str << key.to_string();
}

void to_json(nlohmann::json & json, const RuleKey & key)
{
    json = key.to_string();
}

} // namespace artcache

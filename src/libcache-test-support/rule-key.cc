#include <exception> // Needed by rapidcheck on Darwin

#include <rapidcheck/gen/Arbitrary.h>
#include <rapidcheck.h>

#include "artcache/cache/tests/rule-key.hh"

namespace artcache {

void showValue(const RuleKey & key, std::ostream & os)
{
    os << key.to_string();
}

} // namespace artcache

namespace rc {
using namespace artcache;

static Gen<char> hexDigit()
{
    return gen::elementOf(std::string("0123456789abcdef"));
}

Gen<RuleKey> Arbitrary<RuleKey>::arbitrary()
{
    /* Between 1 and 32 bytes, like the digests build engines use. */
    return gen::map(
        gen::mapcat(
            gen::inRange<size_t>(1, 33),
            [](size_t bytes) { return gen::container<std::string>(bytes * 2, hexDigit()); }),
        [](const std::string & hex) { return RuleKey::parse(hex); });
}

} // namespace rc

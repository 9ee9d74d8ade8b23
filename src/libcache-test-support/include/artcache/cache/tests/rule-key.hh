#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "artcache/cache/rule-key.hh"

namespace artcache {

// For rapidcheck
void showValue(const RuleKey & key, std::ostream & os);

} // namespace artcache

namespace rc {
using namespace artcache;

template<>
struct Arbitrary<RuleKey>
{
    static Gen<RuleKey> arbitrary();
};

} // namespace rc

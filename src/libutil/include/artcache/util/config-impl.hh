#pragma once
/**
 * @file
 *
 * Template definitions for `BaseSetting`. Include this only where a
 * `BaseSetting<T>` is instantiated for a new `T`.
 */

#include "artcache/util/configuration.hh"
#include "artcache/util/error.hh"
#include "artcache/util/strings.hh"

#include <nlohmann/json.hpp>

namespace artcache {

template<>
bool BaseSetting<Strings>::isAppendable() const;

template<typename T>
bool BaseSetting<T>::isAppendable() const
{
    return false;
}

template<>
void BaseSetting<Strings>::appendOrSet(Strings newValue, bool append);

template<typename T>
void BaseSetting<T>::appendOrSet(T newValue, bool append)
{
    value = std::move(newValue);
}

template<typename T>
void BaseSetting<T>::set(const std::string & str, bool append)
{
    appendOrSet(parse(str), append);
}

template<typename T>
nlohmann::json BaseSetting<T>::toJSON() const
{
    auto res = AbstractSetting::toJSON();
    res["value"] = value;
    res["defaultValue"] = defaultValue;
    return res;
}

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const;
template<>
std::string BaseSetting<std::string>::to_string() const;
template<>
Strings BaseSetting<Strings>::parse(const std::string & str) const;
template<>
std::string BaseSetting<Strings>::to_string() const;

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral_v<T>, "settings of this type need a parse() specialisation");

    if (auto n = string2Int<T>(trim(str)))
        return *n;
    throw UsageError("setting '%s' expects a number, got '%s'", name, str);
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral_v<T>, "settings of this type need a to_string() specialisation");

    return std::to_string(value);
}

} // namespace artcache

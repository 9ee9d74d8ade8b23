#include "artcache/util/configuration.hh"
#include "artcache/util/config-impl.hh"
#include "artcache/util/file-system.hh"
#include "artcache/util/logging.hh"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace artcache {

Config::Config(StringMap initials)
    : unknownSettings(std::move(initials))
{
}

Config::~Config() {}

bool Config::set(const std::string & name, const std::string & value)
{
    if (auto i = settings.find(name); i != settings.end()) {
        i->second->set(value);
        i->second->overridden = true;
        return true;
    }

    if (!hasPrefix(name, "extra-"))
        return false;

    auto i = settings.find(name.substr(6));
    if (i == settings.end() || !i->second->isAppendable())
        return false;
    i->second->set(value, true);
    i->second->overridden = true;
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    settings.emplace(setting->name, setting);

    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(i->second);
        setting->overridden = true;
        unknownSettings.erase(i);
    }
}

std::map<std::string, Config::SettingInfo> Config::getSettings(bool overriddenOnly) const
{
    std::map<std::string, SettingInfo> res;
    for (auto & [name, setting] : settings)
        if (!overriddenOnly || setting->overridden)
            res.emplace(name, SettingInfo{setting->to_string(), setting->description});
    return res;
}

/**
 * Split `contents` into assignments, expanding includes in place.
 */
static void parseConfigLines(
    const std::string & contents, const std::string & path, std::vector<std::pair<std::string, std::string>> & res)
{
    for (auto & rawLine : tokenizeString<std::vector<std::string>>(contents, "\n")) {
        auto line = rawLine.substr(0, rawLine.find('#'));

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        if (tokens[0] == "include" || tokens[0] == "!include") {
            if (tokens.size() != 2)
                throw UsageError("expected a single file name in '%s' in '%s'", trim(line), path);
            auto included = std::filesystem::absolute(std::filesystem::path(path).parent_path() / tokens[1]);
            if (pathExists(included))
                parseConfigLines(readFile(included), included.string(), res);
            else if (tokens[0] == "include")
                throw Error("file '%s' included from '%s' not found", included.string(), path);
            continue;
        }

        if (tokens.size() < 2 || tokens[1] != "=")
            throw UsageError("expected 'name = value' but got '%s' in '%s'", trim(line), path);

        res.emplace_back(tokens[0], concatStringsSep(" ", std::vector<std::string>(tokens.begin() + 2, tokens.end())));
    }
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    std::vector<std::pair<std::string, std::string>> assignments;
    parseConfigLines(contents, path, assignments);

    for (auto & [name, value] : assignments)
        if (!set(name, value))
            unknownSettings.insert_or_assign(name, value);
}

void Config::warnUnknownSettings() const
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

nlohmann::json Config::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, setting] : settings)
        res[name] = setting->toJSON();
    return res;
}

std::string Config::toKeyValue() const
{
    std::string res;
    for (auto & [name, setting] : settings)
        res += fmt("%s = %s\n", name, setting->to_string());
    return res;
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description)
    : name(name)
    , description(trim(description))
{
}

AbstractSetting::~AbstractSetting() {}

nlohmann::json AbstractSetting::toJSON() const
{
    return {{"description", description}};
}

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<>
bool BaseSetting<Strings>::isAppendable() const
{
    return true;
}

template<>
Strings BaseSetting<Strings>::parse(const std::string & str) const
{
    return tokenizeString<Strings>(str);
}

template<>
void BaseSetting<Strings>::appendOrSet(Strings newValue, bool append)
{
    if (!append)
        value.clear();
    value.splice(value.end(), newValue);
}

template<>
std::string BaseSetting<Strings>::to_string() const
{
    return concatStringsSep(" ", value);
}

template class BaseSetting<unsigned int>;
template class BaseSetting<unsigned long>;
template class BaseSetting<unsigned long long>;
template class BaseSetting<std::string>;
template class BaseSetting<Strings>;

PathSetting::PathSetting(Config * config, const Path & def, const std::string & name, const std::string & description)
    : BaseSetting<Path>(def, name, description)
{
    config->addSetting(this);
}

Path PathSetting::parse(const std::string & str) const
{
    if (str.empty())
        throw UsageError("setting '%s' needs a path", name);
    auto p = std::filesystem::path(str).lexically_normal().string();
    if (p.size() > 1 && p.back() == '/')
        p.pop_back();
    return p;
}

} // namespace artcache

#pragma once
///@file

#include <map>

#include <nlohmann/json_fwd.hpp>

#include "artcache/util/types.hh"

namespace artcache {

class AbstractSetting;

/**
 * A registry of named settings. Settings are members of a class
 * derived from `Config` and register themselves on construction:
 *
 *   struct MySettings : Config
 *   {
 *       Setting<size_t> threads{this, 4, "threads", "the number of worker threads"};
 *   };
 *
 * Values are assigned by name with `set()`, or in bulk from the text
 * of a configuration file with `applyConfig()`.
 */
class Config
{
    std::map<std::string, AbstractSetting *> settings;

    /**
     * Assignments to names that no setting has claimed yet. A setting
     * registered later picks up its value from here.
     */
    StringMap unknownSettings;

public:

    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

    Config(StringMap initials = {});

    virtual ~Config();

    Config(const Config &) = delete;
    Config & operator=(const Config &) = delete;

    /**
     * Assign `value` to the setting called `name`. `extra-NAME` appends
     * to a list-valued setting instead of replacing it.
     *
     * @return false if there is no such setting.
     *
     * @throws UsageError if the value does not parse.
     */
    bool set(const std::string & name, const std::string & value);

    void addSetting(AbstractSetting * setting);

    /**
     * The current value and description of each setting, optionally
     * restricted to the ones that have been assigned.
     */
    std::map<std::string, SettingInfo> getSettings(bool overriddenOnly = false) const;

    /**
     * Apply the `name = value` lines in `contents`. `#` starts a
     * comment. `include FILE` and `!include FILE` read another file
     * relative to `path`; the latter ignores a missing file. Unknown
     * names are remembered rather than rejected.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    void warnUnknownSettings() const;

    nlohmann::json toJSON() const;

    /**
     * All settings in the format read by `applyConfig()`.
     */
    std::string toKeyValue() const;
};

class AbstractSetting
{
public:

    const std::string name;
    const std::string description;

    bool overridden = false;

    virtual ~AbstractSetting();

    virtual void set(const std::string & str, bool append = false) = 0;

    virtual bool isAppendable() const = 0;

    virtual std::string to_string() const = 0;

    virtual nlohmann::json toJSON() const;

protected:

    AbstractSetting(const std::string & name, const std::string & description);
};

/**
 * A setting holding a `T`. Each `T` needs `parse()` and `to_string()`;
 * integers get them from config-impl.hh, other types specialise them.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;
    const T defaultValue;

    virtual T parse(const std::string & str) const;

    /**
     * Only list types may be appended to; the rest ignore `append`.
     */
    void appendOrSet(T newValue, bool append);

public:

    BaseSetting(const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
        , defaultValue(def)
    {
    }

    const T & get() const
    {
        return value;
    }

    operator const T &() const
    {
        return value;
    }

    void set(const std::string & str, bool append = false) override final;

    bool isAppendable() const override final;

    std::string to_string() const override;

    nlohmann::json toJSON() const override;
};

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * config, const T & def, const std::string & name, const std::string & description)
        : BaseSetting<T>(def, name, description)
    {
        config->addSetting(this);
    }
};

/**
 * A non-empty path, stored in normal form without a trailing slash.
 */
class PathSetting : public BaseSetting<Path>
{
public:

    PathSetting(Config * config, const Path & def, const std::string & name, const std::string & description);

    Path parse(const std::string & str) const override;
};

} // namespace artcache

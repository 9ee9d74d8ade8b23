#include "artcache/util/configuration.hh"
#include "artcache/util/error.hh"
#include "artcache/util/file-system.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace artcache {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    std::string value;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};
    ASSERT_EQ(config.set("name-of-the-setting", "value"), true);
    ASSERT_EQ(foo.get(), "value");
}

TEST(Config, getDefinedSetting)
{
    Config config;
    Setting<std::string> foo{&config, "default", "name-of-the-setting", "description"};

    auto settings = config.getSettings();
    const auto iter = settings.find("name-of-the-setting");
    ASSERT_NE(iter, settings.end());
    ASSERT_EQ(iter->second.value, "default");
    ASSERT_EQ(iter->second.description, "description");
}

TEST(Config, getOverriddenOnly)
{
    Config config;
    Setting<std::string> foo{&config, "", "foo", "description"};
    Setting<std::string> bar{&config, "", "bar", "description"};

    ASSERT_TRUE(config.getSettings(/* overriddenOnly = */ true).empty());

    config.set("bar", "x");
    auto settings = config.getSettings(/* overriddenOnly = */ true);
    ASSERT_EQ(settings.size(), 1u);
    ASSERT_EQ(settings.begin()->first, "bar");
    ASSERT_EQ(settings.begin()->second.value, "x");
}

TEST(Config, setIntegerSetting)
{
    Config config;
    Setting<unsigned long> n{&config, 3, "n", "description"};
    config.set("n", "42");
    ASSERT_EQ(n.get(), 42u);
}

TEST(Config, integerSettingToJSON)
{
    Config config;
    Setting<unsigned long> n{&config, 3, "n", "description"};
    config.set("n", "5");
    auto json = config.toJSON();
    ASSERT_EQ(json["n"]["value"], 5);
    ASSERT_EQ(json["n"]["defaultValue"], 3);
}

TEST(Config, badIntegerIsUsageError)
{
    Config config;
    Setting<unsigned long> n{&config, 3, "n", "description"};
    ASSERT_THROW(config.set("n", "many"), UsageError);
    ASSERT_EQ(n.get(), 3u);
}

TEST(Config, stringsAreAppendable)
{
    Config config;
    Setting<Strings> list{&config, {"a"}, "list", "description"};
    config.set("list", "b c");
    ASSERT_EQ(list.get(), Strings({"b", "c"}));
    config.set("extra-list", "d");
    ASSERT_EQ(list.get(), Strings({"b", "c", "d"}));
}

TEST(Config, extraPrefixOnlyForAppendables)
{
    Config config;
    Setting<std::string> foo{&config, "", "foo", "description"};
    ASSERT_EQ(config.set("extra-foo", "x"), false);
}

TEST(Config, pathSettingIsNormalised)
{
    Config config;
    PathSetting p{&config, "/tmp", "p", "description"};
    config.set("p", "/a/b/../c/");
    ASSERT_EQ(p.get(), "/a/c");
}

TEST(Config, toKeyValue)
{
    Config config;
    Setting<std::string> foo{&config, "bar", "foo", "description"};
    Setting<Strings> list{&config, {"a", "b"}, "list", "description"};
    ASSERT_EQ(config.toKeyValue(), "foo = bar\nlist = a b\n");
}

TEST(Config, toJSON)
{
    Config config;
    Setting<std::string> foo{&config, "bar", "foo", "description"};
    config.set("foo", "baz");
    auto json = config.toJSON();
    ASSERT_EQ(json["foo"]["value"], "baz");
    ASSERT_EQ(json["foo"]["defaultValue"], "bar");
    ASSERT_EQ(json["foo"]["description"], "description");
}

/* ----------------------------------------------------------------------------
 * applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfigEmpty)
{
    Config config;
    Setting<std::string> foo{&config, "default", "foo", "description"};
    config.applyConfig("");
    config.applyConfig("\n  # nothing here\n\n");
    ASSERT_EQ(foo.get(), "default");
    ASSERT_TRUE(config.getSettings(/* overriddenOnly = */ true).empty());
}

TEST(Config, applyConfigParsesLinesAndComments)
{
    Config config;
    Setting<std::string> foo{&config, "", "foo", "description"};
    Setting<Strings> list{&config, {}, "list", "description"};
    config.applyConfig(
        "# a comment\n"
        "foo = bar baz # trailing\n"
        "\n"
        "list = x   y\n");
    ASSERT_EQ(foo.get(), "bar baz");
    ASSERT_EQ(list.get(), Strings({"x", "y"}));
}

TEST(Config, applyConfigSyntaxError)
{
    Config config;
    ASSERT_THROW(config.applyConfig("foo bar\n"), UsageError);
    ASSERT_THROW(config.applyConfig("foo\n"), UsageError);
}

TEST(Config, applyConfigKeepsUnknownSettingsForLater)
{
    Config config;
    config.applyConfig("later = yes\n");

    Setting<std::string> later{&config, "no", "later", "description"};
    ASSERT_EQ(later.get(), "yes");
}

TEST(Config, applyConfigFollowsIncludes)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    writeFile(tmpDir / "included.conf", "foo = included\n");

    Config config;
    Setting<std::string> foo{&config, "", "foo", "description"};
    config.applyConfig("include included.conf\n", (tmpDir / "main.conf").string());
    ASSERT_EQ(foo.get(), "included");
}

TEST(Config, applyConfigMissingInclude)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);
    auto path = (tmpDir / "main.conf").string();

    Config config;
    ASSERT_THROW(config.applyConfig("include missing.conf\n", path), Error);
    ASSERT_NO_THROW(config.applyConfig("!include missing.conf\n", path));
}

} // namespace artcache

#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "artcache/util/strings.hh"
#include "artcache/util/error.hh"

namespace artcache {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    Strings strings;

    ASSERT_EQ(concatStringsSep(",", strings), "");
}

TEST(concatStringsSep, justOne)
{
    Strings strings;
    strings.push_back("this");

    ASSERT_EQ(concatStringsSep(",", strings), "this");
}

TEST(concatStringsSep, emptyStrings)
{
    Strings strings;
    strings.push_back("");
    strings.push_back("");

    ASSERT_EQ(concatStringsSep(",", strings), ",");
}

TEST(concatStringsSep, buildCommaSeparatedString)
{
    Strings strings;
    strings.push_back("this");
    strings.push_back("is");
    strings.push_back("great");

    ASSERT_EQ(concatStringsSep(", ", strings), "this, is, great");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(""), expected);
}

TEST(tokenizeString, oneSep)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(" "), expected);
}

TEST(tokenizeString, tokenizeSpacesWithDefaults)
{
    auto s = "foo bar baz";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeTabsNewlinesWithDefaults)
{
    auto s = "foo\tbar\nbaz\r\n  qux";
    Strings expected = {"foo", "bar", "baz", "qux"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeWithCustomSep)
{
    auto s = "foo\n,bar\n,baz\n";
    Strings expected = {"foo\n", "bar\n", "baz\n"};

    ASSERT_EQ(tokenizeString<Strings>(s, ","), expected);
}

TEST(tokenizeString, intoSet)
{
    StringSet expected = {"a", "b"};

    ASSERT_EQ(tokenizeString<StringSet>("b a b"), expected);
}

/* ----------------------------------------------------------------------------
 * trim, chomp
 * --------------------------------------------------------------------------*/

TEST(trim, removesWhitespaceAtBothEnds)
{
    ASSERT_EQ(trim("  \tfoo bar\n"), "foo bar");
    ASSERT_EQ(trim(""), "");
    ASSERT_EQ(trim(" \n "), "");
}

TEST(chomp, removesTrailingWhitespace)
{
    ASSERT_EQ(chomp("  foo \n"), "  foo");
}

/* ----------------------------------------------------------------------------
 * replaceStrings
 * --------------------------------------------------------------------------*/

TEST(replaceStrings, emptyString)
{
    ASSERT_EQ(replaceStrings("", "this", "that"), "");
}

TEST(replaceStrings, successfulReplace)
{
    ASSERT_EQ(replaceStrings("this and that", "this", "that"), "that and that");
}

TEST(replaceStrings, replacesEveryOccurrence)
{
    ASSERT_EQ(replaceStrings("{x} + {x}", "{x}", "1"), "1 + 1");
}

TEST(replaceStrings, doesNotRescanReplacement)
{
    ASSERT_EQ(replaceStrings("{a}", "{a}", "{a}{a}"), "{a}{a}");
}

/* ----------------------------------------------------------------------------
 * toLower, hasPrefix, hasSuffix
 * --------------------------------------------------------------------------*/

TEST(toLower, lowercasesAscii)
{
    ASSERT_EQ(toLower("DeadBEEF"), "deadbeef");
}

TEST(hasPrefix, works)
{
    ASSERT_TRUE(hasPrefix("foobar", "foo"));
    ASSERT_TRUE(hasPrefix("foo", ""));
    ASSERT_FALSE(hasPrefix("foo", "foobar"));
    ASSERT_FALSE(hasPrefix("foobar", "bar"));
}

TEST(hasSuffix, works)
{
    ASSERT_TRUE(hasSuffix("foobar", "bar"));
    ASSERT_FALSE(hasSuffix("bar", "foobar"));
    ASSERT_FALSE(hasSuffix("foobar", "foo"));
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, parsesNumbers)
{
    ASSERT_EQ(string2Int<unsigned int>("42"), 42u);
    ASSERT_EQ(string2Int<int>("-7"), -7);
}

TEST(string2Int, rejectsGarbage)
{
    ASSERT_EQ(string2Int<unsigned int>("4x2"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>(""), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
}

RC_GTEST_PROP(string2Int, inverseOfToString, (uint64_t n))
{
    RC_ASSERT(string2Int<uint64_t>(std::to_string(n)) == n);
}

} // namespace artcache

#include <gtest/gtest.h>

#include "artcache/util/serialise.hh"

namespace artcache {

/* ----------------------------------------------------------------------------
 * writeInt32 / readInt32
 * --------------------------------------------------------------------------*/

TEST(writeInt32, isBigEndian)
{
    StringSink sink;
    writeInt32(sink, 0x01020304);
    ASSERT_EQ(sink.s, std::string("\x01\x02\x03\x04", 4));
}

TEST(writeInt32, negative)
{
    StringSink sink;
    writeInt32(sink, -2);
    ASSERT_EQ(sink.s, std::string("\xff\xff\xff\xfe", 4));
}

TEST(readInt32, readsBackNegative)
{
    StringSource source(std::string_view("\xff\xff\xff\xfe", 4));
    ASSERT_EQ(readInt32(source), -2);
}

TEST(readInt32, throwsOnTruncation)
{
    StringSource source(std::string_view("\x00\x01", 2));
    ASSERT_THROW(readInt32(source), EndOfFile);
}

/* ----------------------------------------------------------------------------
 * writeShortString / readShortString
 * --------------------------------------------------------------------------*/

TEST(writeShortString, prefixesTwoByteLength)
{
    StringSink sink;
    writeShortString(sink, "abc");
    ASSERT_EQ(sink.s, std::string("\x00\x03" "abc", 5));
}

TEST(writeShortString, empty)
{
    StringSink sink;
    writeShortString(sink, "");
    ASSERT_EQ(sink.s, std::string("\x00\x00", 2));
}

TEST(writeShortString, acceptsMaximumLength)
{
    StringSink sink;
    writeShortString(sink, std::string(0xffff, 'x'));
    ASSERT_EQ(sink.s.size(), 0xffffu + 2);
    ASSERT_EQ(sink.s.substr(0, 2), "\xff\xff");
}

TEST(writeShortString, rejectsOverlongStrings)
{
    StringSink sink;
    ASSERT_THROW(writeShortString(sink, std::string(0x10000, 'x')), Error);
}

TEST(readShortString, readsBytesVerbatim)
{
    std::string data("\x00\x04" "a\xc3\xa9\x00", 6);
    StringSource source(data);
    ASSERT_EQ(readShortString(source), std::string("a\xc3\xa9\x00", 4));
    ASSERT_TRUE(source.exhausted());
}

TEST(readShortString, throwsOnTruncation)
{
    std::string data("\x00\x05" "ab", 4);
    StringSource source(data);
    ASSERT_THROW(readShortString(source), EndOfFile);
}

/* ----------------------------------------------------------------------------
 * Sources and sinks
 * --------------------------------------------------------------------------*/

TEST(Source, drainIntoCountsBytes)
{
    StringSource source(std::string_view("hello world"));
    StringSink sink;
    ASSERT_EQ(source.drainInto(sink), 11u);
    ASSERT_EQ(sink.s, "hello world");
}

TEST(TeeSource, copiesWhatIsRead)
{
    StringSource source(std::string_view("abcdef"));
    StringSink copy;
    TeeSource tee(source, copy);
    ASSERT_EQ(readBytes(tee, 4), "abcd");
    ASSERT_EQ(copy.s, "abcd");
}

TEST(SizedSource, stopsAtLimit)
{
    StringSource source(std::string_view("abcdef"));
    SizedSource sized(source, 3);
    ASSERT_EQ(sized.drain(), "abc");
    ASSERT_EQ(source.drain(), "def");
}

TEST(ChainSource, readsBothInOrder)
{
    StringSource a(std::string_view("abc")), b(std::string_view("def"));
    ChainSource chain(a, b);
    ASSERT_EQ(chain.drain(), "abcdef");
}

TEST(LengthSink, counts)
{
    LengthSink sink;
    sink("abc");
    sink("");
    sink("de");
    ASSERT_EQ(sink.length, 5u);
}

TEST(TeeSink, writesToBoth)
{
    StringSink a, b;
    TeeSink tee(a, b);
    tee("xyz");
    ASSERT_EQ(a.s, "xyz");
    ASSERT_EQ(b.s, "xyz");
}

} // namespace artcache

#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "artcache/util/hash.hh"

namespace artcache {

/* ----------------------------------------------------------------------------
 * crc32
 * --------------------------------------------------------------------------*/

TEST(crc32, checkValue)
{
    // The standard check value of CRC-32/ISO-HDLC.
    ASSERT_EQ(crc32("123456789").value, 0xcbf43926u);
}

TEST(crc32, emptyString)
{
    ASSERT_EQ(crc32("").value, 0u);
}

TEST(crc32, toStringIsPaddedHex)
{
    ASSERT_EQ(crc32("123456789").to_string(), "cbf43926");
    ASSERT_EQ(Crc32{0x1f}.to_string(), "0000001f");
}

TEST(crc32, bytesAreLeastSignificantFirst)
{
    ASSERT_EQ(crc32("123456789").toBytes(), std::string("\x26\x39\xf4\xcb", 4));
}

TEST(crc32, fromBytesInvertsToBytes)
{
    auto c = crc32("hello");
    ASSERT_EQ(Crc32::fromBytes(c.toBytes()), c);
}

TEST(crc32, fromBytesRejectsWrongLength)
{
    ASSERT_THROW(Crc32::fromBytes("abc"), Error);
    ASSERT_THROW(Crc32::fromBytes("abcde"), Error);
}

/* ----------------------------------------------------------------------------
 * Crc32Sink
 * --------------------------------------------------------------------------*/

TEST(Crc32Sink, countsBytes)
{
    Crc32Sink sink;
    sink("1234");
    sink("56789");
    auto [c, n] = sink.currentHash();
    ASSERT_EQ(c.value, 0xcbf43926u);
    ASSERT_EQ(n, 9u);
}

TEST(Crc32Sink, canContinueAfterCurrentHash)
{
    Crc32Sink sink;
    sink("abc");
    ASSERT_EQ(sink.currentHash().first, crc32("abc"));
    sink("def");
    ASSERT_EQ(sink.currentHash().first, crc32("abcdef"));
}

RC_GTEST_PROP(Crc32Sink, chunkingDoesNotMatter, (std::string data, size_t split))
{
    auto at = data.empty() ? 0 : split % data.size();
    Crc32Sink sink;
    sink(std::string_view(data).substr(0, at));
    sink(std::string_view(data).substr(at));
    RC_ASSERT(sink.currentHash().first == crc32(data));
}

} // namespace artcache

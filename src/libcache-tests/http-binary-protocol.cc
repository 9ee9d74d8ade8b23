#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "artcache/cache/http-binary-protocol.hh"
#include "artcache/cache/tests/rule-key.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

using namespace std::string_literals;

static std::string encodeBlock(std::string_view block)
{
    StringSink sink;
    writeInt32(sink, block.size());
    sink(block);
    return std::move(sink.s);
}

/* ----------------------------------------------------------------------------
 * Encoding
 * --------------------------------------------------------------------------*/

TEST(ArtifactMetadataHeader, serialiseKnownBytes)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {{"k", "v"}}};
    ASSERT_EQ(
        header.serialise(),
        "\x00\x00\x00\x01"
        "\x00\x02"
        "ab"
        "\x00\x00\x00\x01"
        "\x00\x01"
        "k"
        "\x00\x00\x00\x01"
        "v"s);
}

TEST(ArtifactMetadataHeader, serialiseEmptyMetadata)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab"), RuleKey::parse("cd")}, {}};
    ASSERT_EQ(
        header.serialise(),
        "\x00\x00\x00\x02"
        "\x00\x02"
        "ab"
        "\x00\x02"
        "cd"
        "\x00\x00\x00\x00"s);
}

TEST(ArtifactMetadataHeader, metadataValuesAreRawBytes)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {{"bin", "\x00\xff\n"s}}};
    auto fields = header.serialise();
    StringSource source(fields);
    ASSERT_EQ(ArtifactMetadataHeader::parse(source), header);
}

TEST(createKeysHeader, knownBytes)
{
    ASSERT_EQ(
        createKeysHeader({RuleKey::parse("ab"), RuleKey::parse("cd")}),
        "\x00\x00\x00\x02"
        "\x00\x02"
        "ab"
        "\x00\x02"
        "cd"s);
}

TEST(createMetadataBlock, checksumCoversFieldsAndPayload)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {{"k", "v"}}};
    StringSource payload(std::string_view("payload"));
    auto block = createMetadataBlock(header, payload);

    auto fields = header.serialise();
    ASSERT_EQ(block.size(), fields.size() + 4);
    ASSERT_EQ(block.substr(0, fields.size()), fields);
    ASSERT_EQ(block.substr(fields.size()), crc32(fields + "payload").toBytes());
}

TEST(FetchResponse, layout)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {}};
    FetchResponse response(header, "data");

    StringSink sink;
    response.write(sink);

    StringSource payload(std::string_view("data"));
    auto expected = encodeBlock(createMetadataBlock(header, payload)) + "data";
    ASSERT_EQ(sink.s, expected);
    ASSERT_EQ(response.getContentLength(), expected.size());
}

/* ----------------------------------------------------------------------------
 * Decoding
 * --------------------------------------------------------------------------*/

TEST(readMetadataBlock, parsesBlock)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {{"k", "v"}}};
    StringSource payload(std::string_view("data"));
    auto data = encodeBlock(createMetadataBlock(header, payload)) + "data";

    StringSource source(data);
    auto block = readMetadataBlock(source);
    ASSERT_EQ(block.header, header);
    ASSERT_EQ(block.rawFields, header.serialise());
    ASSERT_EQ(block.expectedChecksum, crc32(header.serialise() + "data"));
    ASSERT_EQ(source.drain(), "data");
}

TEST(readMetadataBlock, rejectsOversizedBlockWithoutReadingIt)
{
    StringSink sink;
    writeInt32(sink, maxMetadataBlockSize + 1);
    StringSource source(sink.s);
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataBlock, rejectsNegativeSize)
{
    StringSink sink;
    writeInt32(sink, -1);
    StringSource source(sink.s);
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataBlock, rejectsBlockTooSmallForChecksum)
{
    auto data = encodeBlock("abc");
    StringSource source(data);
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataBlock, rejectsEmptyInput)
{
    StringSource source(std::string_view(""));
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataBlock, rejectsTruncatedBlock)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {}};
    StringSource payload(std::string_view(""));
    auto data = encodeBlock(createMetadataBlock(header, payload));
    data.resize(data.size() - 2);
    StringSource source(data);
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataBlock, rejectsTruncatedFields)
{
    // Claims two keys but carries one.
    auto fields =
        "\x00\x00\x00\x02"
        "\x00\x02"
        "ab"s;
    auto data = encodeBlock(fields + crc32(fields).toBytes());
    StringSource source(data);
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataBlock, rejectsTrailingBytes)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {}};
    auto fields = header.serialise() + "junk";
    auto data = encodeBlock(fields + crc32(fields).toBytes());
    StringSource source(data);
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataBlock, rejectsInvalidRuleKey)
{
    auto fields =
        "\x00\x00\x00\x01"
        "\x00\x02"
        "zz"
        "\x00\x00\x00\x00"s;
    auto data = encodeBlock(fields + crc32(fields).toBytes());
    StringSource source(data);
    ASSERT_THROW(readMetadataBlock(source), ProtocolError);
}

TEST(readMetadataAndPayload, detectsCorruptPayload)
{
    ArtifactMetadataHeader header{{RuleKey::parse("ab")}, {}};
    StringSource payload(std::string_view("good"));
    auto data = encodeBlock(createMetadataBlock(header, payload)) + "evil";

    StringSource source(data);
    StringSink sink;
    auto result = readMetadataAndPayload(source, sink);
    ASSERT_EQ(sink.s, "evil");
    ASSERT_EQ(result.payloadSizeBytes, 4u);
    ASSERT_NE(result.actualChecksum, result.block.expectedChecksum);
}

/* ----------------------------------------------------------------------------
 * StoreRequest
 * --------------------------------------------------------------------------*/

TEST(StoreRequest, serverCanDecodeIt)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);
    writeFile(tmpDir / "artifact", "artifact contents");

    auto key1 = RuleKey::parse("aa"), key2 = RuleKey::parse("bb");
    ArtifactInfo info({key1, key2}, {{"origin", "test"}});
    StoreRequest request(info, tmpDir / "artifact");

    StringSink body;
    request.write(body);
    ASSERT_EQ(request.getContentLength(), body.s.size());
    ASSERT_EQ(request.getPayloadSize(), 17u);

    StringSource source(body.s);
    StringSink payload;
    auto result = readStoreRequest(source, payload);

    ASSERT_EQ(result.ruleKeys, std::vector<RuleKey>({key1, key2}));
    ASSERT_EQ(result.metadataAndPayload.block.header.ruleKeys, std::vector<RuleKey>({key1, key2}));
    ASSERT_EQ(result.metadataAndPayload.block.header.metadata, info.metadata());
    ASSERT_EQ(payload.s, "artifact contents");
    ASSERT_EQ(result.metadataAndPayload.actualChecksum, result.metadataAndPayload.block.expectedChecksum);
}

TEST(StoreRequest, bodyStartsWithKeysHeader)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);
    writeFile(tmpDir / "artifact", "");

    ArtifactInfo info({RuleKey::parse("aa")});
    StoreRequest request(info, tmpDir / "artifact");

    auto body = request.openBody()->drain();
    auto keys = createKeysHeader(info.ruleKeys());
    ASSERT_EQ(body.substr(0, keys.size()), keys);
    ASSERT_EQ(request.getPayloadSize(), 0u);
}

TEST(StoreRequest, missingFileThrows)
{
    ArtifactInfo info({RuleKey::parse("aa")});
    ASSERT_THROW(StoreRequest(info, "/nonexistent/artifact"), SysError);
}

RC_GTEST_PROP(
    FetchResponse,
    decodesToWhatWasEncoded,
    (const std::vector<RuleKey> & keys, const StringMap & metadata, const std::string & payload))
{
    RC_PRE(!keys.empty());

    ArtifactMetadataHeader header{keys, metadata};
    StringSink body;
    FetchResponse(header, payload).write(body);

    StringSource source(body.s);
    StringSink sink;
    auto result = readMetadataAndPayload(source, sink);

    RC_ASSERT(result.block.header == header);
    RC_ASSERT(sink.s == payload);
    RC_ASSERT(result.actualChecksum == result.block.expectedChecksum);
}

} // namespace artcache

#pragma once
/**
 * @file
 *
 * The envelope spoken with a remote cache server.
 *
 * All integers are 4-byte big-endian. Strings are "short strings": a
 * 2-byte big-endian length and the raw bytes.
 *
 * The metadata block is
 *
 *     int keyCount, string key*, int entryCount, (string name, int valueLength, value)*, crc32
 *
 * where the CRC-32 (4 bytes, least significant first) covers all of
 * the block before it plus the artifact payload. A block may not exceed
 * `maxMetadataBlockSize`.
 *
 * A fetch response body is `int blockLength, block, payload`. A store
 * request body is `int keyCount, string key*, int blockLength, block,
 * payload`. Payload lengths are not encoded; they follow from the
 * content length of the enclosing message.
 */

#include "artcache/cache/artifact-info.hh"
#include "artcache/util/hash.hh"
#include "artcache/util/serialise.hh"

#include <filesystem>
#include <memory>

namespace artcache {

/**
 * The remote end sent something that is not a valid envelope.
 */
MakeError(ProtocolError, Error);

MakeError(ChecksumMismatch, ProtocolError);

constexpr uint64_t maxMetadataBlockSize = 64 * 1024 * 1024;

/**
 * The fields of a metadata block, without its checksum.
 */
struct ArtifactMetadataHeader
{
    std::vector<RuleKey> ruleKeys;
    StringMap metadata;

    /**
     * The encoded fields, i.e. the block minus its trailing checksum.
     */
    std::string serialise() const;

    /**
     * Decode the fields from the start of `source`.
     *
     * @throws ProtocolError
     */
    static ArtifactMetadataHeader parse(Source & source);

    bool hasRuleKey(const RuleKey & key) const;

    bool operator==(const ArtifactMetadataHeader &) const = default;
};

/**
 * Encode the key list that prefixes a store request.
 */
std::string createKeysHeader(const std::vector<RuleKey> & ruleKeys);

/**
 * Encode a complete metadata block, consuming `payload` to compute the
 * checksum.
 */
std::string createMetadataBlock(const ArtifactMetadataHeader & header, Source & payload);

/**
 * A metadata block as received, before the payload has been read.
 */
struct MetadataBlock
{
    ArtifactMetadataHeader header;

    /**
     * The checksum the sender computed.
     */
    Crc32 expectedChecksum;

    /**
     * The bytes of the block covered by the checksum.
     */
    std::string rawFields;
};

/**
 * Read `int blockLength, block` from `source`.
 *
 * @throws ProtocolError if the block is oversized or malformed.
 */
MetadataBlock readMetadataBlock(Source & source);

struct MetadataAndPayloadReadResult
{
    MetadataBlock block;
    Crc32 actualChecksum;
    uint64_t payloadSizeBytes;
};

/**
 * Read a metadata block and copy the rest of `source` to
 * `payloadSink`. The checksum is computed but not verified.
 */
MetadataAndPayloadReadResult readMetadataAndPayload(Source & source, Sink & payloadSink);

struct StoreRequestReadResult
{
    std::vector<RuleKey> ruleKeys;
    MetadataAndPayloadReadResult metadataAndPayload;
};

/**
 * Decode a store request body, as a server does.
 */
StoreRequestReadResult readStoreRequest(Source & source, Sink & payloadSink);

/**
 * A store request for the artifact in a file.
 */
class StoreRequest
{
    std::filesystem::path payloadPath;
    std::string rawKeys;
    std::string rawMetadata;
    uint64_t payloadSize;

public:

    StoreRequest(const ArtifactInfo & info, const std::filesystem::path & payloadPath);

    uint64_t getContentLength() const;

    uint64_t getPayloadSize() const
    {
        return payloadSize;
    }

    /**
     * The encoded request body; the payload is read from the file
     * while the body is consumed.
     */
    std::unique_ptr<Source> openBody() const;

    void write(Sink & sink) const;
};

/**
 * A fetch response for an artifact held in memory, as sent by a
 * server.
 */
class FetchResponse
{
    std::string rawMetadata;
    std::string payload;

public:

    FetchResponse(const ArtifactMetadataHeader & header, std::string payload);

    uint64_t getContentLength() const;

    void write(Sink & sink) const;
};

} // namespace artcache

#include "artcache/cache/http-binary-protocol.hh"
#include "artcache/util/file-system.hh"

#include <algorithm>
#include <fcntl.h>

namespace artcache {

static void writeRuleKeys(Sink & sink, const std::vector<RuleKey> & ruleKeys)
{
    writeInt32(sink, ruleKeys.size());
    for (auto & key : ruleKeys)
        writeShortString(sink, key.to_string());
}

static std::vector<RuleKey> readRuleKeys(Source & source)
{
    auto count = readInt32(source);
    if (count < 0)
        throw ProtocolError("negative rule key count %d", count);
    std::vector<RuleKey> ruleKeys;
    for (int32_t i = 0; i < count; ++i) {
        auto s = readShortString(source);
        try {
            ruleKeys.push_back(RuleKey::parse(s));
        } catch (BadRuleKey & e) {
            throw ProtocolError("invalid rule key in metadata: %s", e.message());
        }
    }
    return ruleKeys;
}

std::string ArtifactMetadataHeader::serialise() const
{
    StringSink sink;
    writeRuleKeys(sink, ruleKeys);
    writeInt32(sink, metadata.size());
    for (auto & [name, value] : metadata) {
        writeShortString(sink, name);
        writeInt32(sink, value.size());
        sink(value);
        if (sink.s.size() > maxMetadataBlockSize)
            throw Error("metadata block exceeds %d bytes", maxMetadataBlockSize);
    }
    return std::move(sink.s);
}

ArtifactMetadataHeader ArtifactMetadataHeader::parse(Source & source)
{
    try {
        ArtifactMetadataHeader header;
        header.ruleKeys = readRuleKeys(source);
        auto count = readInt32(source);
        if (count < 0)
            throw ProtocolError("negative metadata entry count %d", count);
        for (int32_t i = 0; i < count; ++i) {
            auto name = readShortString(source);
            auto size = readInt32(source);
            if (size < 0 || uint64_t(size) > maxMetadataBlockSize)
                throw ProtocolError("invalid size %d of metadata entry '%s'", size, name);
            header.metadata.insert_or_assign(std::move(name), readBytes(source, size));
        }
        return header;
    } catch (EndOfFile &) {
        throw ProtocolError("truncated metadata block");
    }
}

bool ArtifactMetadataHeader::hasRuleKey(const RuleKey & key) const
{
    return std::find(ruleKeys.begin(), ruleKeys.end(), key) != ruleKeys.end();
}

std::string createKeysHeader(const std::vector<RuleKey> & ruleKeys)
{
    StringSink sink;
    writeRuleKeys(sink, ruleKeys);
    return std::move(sink.s);
}

std::string createMetadataBlock(const ArtifactMetadataHeader & header, Source & payload)
{
    auto block = header.serialise();
    Crc32Sink hasher;
    hasher(block);
    payload.drainInto(hasher);
    block += hasher.currentHash().first.toBytes();
    if (block.size() > maxMetadataBlockSize)
        throw Error("metadata block exceeds %d bytes", maxMetadataBlockSize);
    return block;
}

MetadataBlock readMetadataBlock(Source & source)
{
    int32_t size;
    try {
        size = readInt32(source);
    } catch (EndOfFile &) {
        throw ProtocolError("missing metadata block");
    }
    if (size < 4 || uint64_t(size) > maxMetadataBlockSize)
        throw ProtocolError("metadata block size of %d is invalid", size);

    std::string raw;
    try {
        raw = readBytes(source, size);
    } catch (EndOfFile &) {
        throw ProtocolError("truncated metadata block");
    }

    std::string_view fields(raw.data(), raw.size() - 4);
    StringSource fieldsSource(fields);
    auto header = ArtifactMetadataHeader::parse(fieldsSource);
    if (!fieldsSource.exhausted())
        throw ProtocolError("metadata block has %d trailing bytes", fields.size() - fieldsSource.pos);

    return MetadataBlock{
        .header = std::move(header),
        .expectedChecksum = Crc32::fromBytes(std::string_view(raw).substr(raw.size() - 4)),
        .rawFields = std::string(fields),
    };
}

MetadataAndPayloadReadResult readMetadataAndPayload(Source & source, Sink & payloadSink)
{
    auto block = readMetadataBlock(source);
    Crc32Sink hasher;
    hasher(block.rawFields);
    TeeSink tee(payloadSink, hasher);
    auto payloadSize = source.drainInto(tee);
    return MetadataAndPayloadReadResult{
        .block = std::move(block),
        .actualChecksum = hasher.currentHash().first,
        .payloadSizeBytes = payloadSize,
    };
}

StoreRequestReadResult readStoreRequest(Source & source, Sink & payloadSink)
{
    std::vector<RuleKey> ruleKeys;
    try {
        ruleKeys = readRuleKeys(source);
    } catch (EndOfFile &) {
        throw ProtocolError("truncated key list");
    }
    return StoreRequestReadResult{
        .ruleKeys = std::move(ruleKeys),
        .metadataAndPayload = readMetadataAndPayload(source, payloadSink),
    };
}

static AutoCloseFD openPayload(const std::filesystem::path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening artifact '%s'", path.string());
    return fd;
}

StoreRequest::StoreRequest(const ArtifactInfo & info, const std::filesystem::path & payloadPath)
    : payloadPath(payloadPath)
    , rawKeys(createKeysHeader(info.ruleKeys()))
{
    auto fd = openPayload(payloadPath);
    FdSource payload(fd.get());
    LengthSink length;
    TeeSource counted(payload, length);
    rawMetadata = createMetadataBlock(ArtifactMetadataHeader{info.ruleKeys(), info.metadata()}, counted);
    payloadSize = length.length;
}

uint64_t StoreRequest::getContentLength() const
{
    return rawKeys.size() + 4 + rawMetadata.size() + payloadSize;
}

namespace {

struct StoreRequestBody : Source
{
    std::string prefix;
    StringSource prefixSource;
    AutoCloseFD fd;
    FdSource payloadSource;
    SizedSource sizedPayload;
    ChainSource chain;

    StoreRequestBody(std::string prefix, AutoCloseFD fd, uint64_t payloadSize)
        : prefix(std::move(prefix))
        , prefixSource(std::string_view(this->prefix))
        , fd(std::move(fd))
        , payloadSource(this->fd.get())
        , sizedPayload(payloadSource, payloadSize)
        , chain(prefixSource, sizedPayload)
    {
    }

    size_t read(char * data, size_t len) override
    {
        return chain.read(data, len);
    }
};

} // namespace

std::unique_ptr<Source> StoreRequest::openBody() const
{
    StringSink prefix;
    prefix(rawKeys);
    writeInt32(prefix, rawMetadata.size());
    prefix(rawMetadata);
    return std::make_unique<StoreRequestBody>(std::move(prefix.s), openPayload(payloadPath), payloadSize);
}

void StoreRequest::write(Sink & sink) const
{
    auto body = openBody();
    body->drainInto(sink);
}

FetchResponse::FetchResponse(const ArtifactMetadataHeader & header, std::string payload)
    : payload(std::move(payload))
{
    StringSource payloadSource(this->payload);
    rawMetadata = createMetadataBlock(header, payloadSource);
}

uint64_t FetchResponse::getContentLength() const
{
    return 4 + rawMetadata.size() + payload.size();
}

void FetchResponse::write(Sink & sink) const
{
    writeInt32(sink, rawMetadata.size());
    sink(rawMetadata);
    sink(payload);
}

} // namespace artcache

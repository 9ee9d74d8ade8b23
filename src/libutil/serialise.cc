#include "artcache/util/serialise.hh"
#include "artcache/util/logging.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace artcache {

static constexpr size_t ioBufferSize = 64 * 1024;

void Source::operator()(char * data, size_t len)
{
    while (len) {
        auto n = read(data, len);
        data += n;
        len -= n;
    }
}

uint64_t Source::drainInto(Sink & sink)
{
    std::array<char, 8192> buf;
    uint64_t total = 0;
    while (true) {
        size_t n;
        try {
            n = read(buf.data(), buf.size());
        } catch (EndOfFile &) {
            return total;
        }
        sink({buf.data(), n});
        total += n;
    }
}

std::string Source::drain()
{
    StringSink sink;
    drainInto(sink);
    return std::move(sink.s);
}

size_t StringSource::read(char * data, size_t len)
{
    if (exhausted())
        throw EndOfFile("end of string reached");
    auto n = s.copy(data, len, pos);
    pos += n;
    return n;
}

FdSink::~FdSink()
{
    try {
        flush();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void FdSink::operator()(std::string_view data)
{
    if (buffer.size() + data.size() <= ioBufferSize) {
        buffer.append(data);
        return;
    }
    flush();
    if (data.size() >= ioBufferSize)
        writeFull(fd, data);
    else
        buffer.assign(data);
}

void FdSink::flush()
{
    if (buffer.empty())
        return;
    std::string pending;
    pending.swap(buffer);
    writeFull(fd, pending);
}

size_t FdSource::read(char * data, size_t len)
{
    if (bufStart == bufEnd) {
        if (!buffer)
            buffer = std::make_unique<char[]>(ioBufferSize);
        ssize_t n;
        do {
            n = ::read(fd, buffer.get(), ioBufferSize);
        } while (n == -1 && errno == EINTR);
        if (n == -1)
            throw SysError("reading from file");
        if (n == 0)
            throw EndOfFile("unexpected end-of-file");
        bufStart = 0;
        bufEnd = n;
    }

    auto n = std::min(len, bufEnd - bufStart);
    memcpy(data, buffer.get() + bufStart, n);
    bufStart += n;
    return n;
}

size_t SizedSource::read(char * data, size_t len)
{
    if (remaining == 0)
        throw EndOfFile("sized source exhausted");
    auto n = orig.read(data, std::min<uint64_t>(len, remaining));
    remaining -= n;
    return n;
}

size_t ChainSource::read(char * data, size_t len)
{
    if (!firstDone) {
        try {
            return first.read(data, len);
        } catch (EndOfFile &) {
            firstDone = true;
        }
    }
    return second.read(data, len);
}

void writeInt32(Sink & sink, int32_t n)
{
    auto u = static_cast<uint32_t>(n);
    char buf[4] = {
        static_cast<char>(u >> 24),
        static_cast<char>(u >> 16),
        static_cast<char>(u >> 8),
        static_cast<char>(u),
    };
    sink({buf, sizeof(buf)});
}

int32_t readInt32(Source & source)
{
    unsigned char buf[4];
    source(reinterpret_cast<char *>(buf), sizeof(buf));
    return static_cast<int32_t>(
        (uint32_t(buf[0]) << 24) | (uint32_t(buf[1]) << 16) | (uint32_t(buf[2]) << 8) | uint32_t(buf[3]));
}

void writeShortString(Sink & sink, std::string_view s)
{
    if (s.size() > 0xffff)
        throw Error("string of %d bytes does not fit in a short string", s.size());
    char len[2] = {static_cast<char>(s.size() >> 8), static_cast<char>(s.size())};
    sink({len, sizeof(len)});
    sink(s);
}

std::string readShortString(Source & source)
{
    unsigned char len[2];
    source(reinterpret_cast<char *>(len), sizeof(len));
    return readBytes(source, (size_t(len[0]) << 8) | len[1]);
}

std::string readBytes(Source & source, size_t len)
{
    std::string res(len, 0);
    source(res.data(), len);
    return res;
}

} // namespace artcache

#pragma once
///@file

#include "artcache/util/error.hh"
#include "artcache/util/file-descriptor.hh"
#include "artcache/util/types.hh"

#include <cstdint>
#include <memory>
#include <string_view>

namespace artcache {

/**
 * Something bytes can be pushed into.
 */
struct Sink
{
    virtual ~Sink() {}

    virtual void operator()(std::string_view data) = 0;
};

/**
 * Something bytes can be pulled from.
 */
struct Source
{
    virtual ~Source() {}

    /**
     * Read between 1 and `len` bytes into `data`, blocking until at
     * least one is available.
     *
     * @throws EndOfFile if nothing is left.
     */
    virtual size_t read(char * data, size_t len) = 0;

    /**
     * Fill `data` with exactly `len` bytes.
     */
    void operator()(char * data, size_t len);

    /**
     * Copy the rest of this source to `sink`.
     *
     * @return the number of bytes copied.
     */
    uint64_t drainInto(Sink & sink);

    std::string drain();
};

struct NullSink : Sink
{
    void operator()(std::string_view data) override {}
};

struct StringSink : Sink
{
    std::string s;

    void operator()(std::string_view data) override
    {
        s.append(data);
    }
};

/**
 * Reads from a view. The viewed string must outlive the source.
 */
struct StringSource : Source
{
    std::string_view s;
    size_t pos = 0;

    StringSource(std::string &&) = delete;

    StringSource(std::string_view s)
        : s(s)
    {
    }

    StringSource(const std::string & s)
        : s(s)
    {
    }

    size_t read(char * data, size_t len) override;

    bool exhausted() const
    {
        return pos == s.size();
    }
};

/**
 * Writes to a file descriptor it does not own, through a buffer that is
 * flushed when full, on `flush()` and on destruction.
 */
struct FdSink : Sink
{
    Descriptor fd;

    FdSink(Descriptor fd)
        : fd(fd)
    {
    }

    FdSink(const FdSink &) = delete;
    FdSink & operator=(const FdSink &) = delete;

    ~FdSink();

    void operator()(std::string_view data) override;

    void flush();

private:
    std::string buffer;
};

/**
 * Reads from a file descriptor it does not own.
 */
struct FdSource : Source
{
    Descriptor fd;

    FdSource(Descriptor fd)
        : fd(fd)
    {
    }

    FdSource(const FdSource &) = delete;
    FdSource & operator=(const FdSource &) = delete;

    size_t read(char * data, size_t len) override;

private:
    std::unique_ptr<char[]> buffer;
    size_t bufStart = 0, bufEnd = 0;
};

struct TeeSink : Sink
{
    Sink & first;
    Sink & second;

    TeeSink(Sink & first, Sink & second)
        : first(first)
        , second(second)
    {
    }

    void operator()(std::string_view data) override
    {
        first(data);
        second(data);
    }
};

/**
 * Passes through what is read from `orig`, copying it to `sink` on
 * the way.
 */
struct TeeSource : Source
{
    Source & orig;
    Sink & sink;

    TeeSource(Source & orig, Sink & sink)
        : orig(orig)
        , sink(sink)
    {
    }

    size_t read(char * data, size_t len) override
    {
        auto n = orig.read(data, len);
        sink({data, n});
        return n;
    }
};

/**
 * The next `size` bytes of `orig`.
 */
struct SizedSource : Source
{
    Source & orig;
    uint64_t remaining;

    SizedSource(Source & orig, uint64_t size)
        : orig(orig)
        , remaining(size)
    {
    }

    size_t read(char * data, size_t len) override;
};

struct LengthSink : Sink
{
    uint64_t length = 0;

    void operator()(std::string_view data) override
    {
        length += data.size();
    }
};

/**
 * `first` until it runs dry, then `second`.
 */
struct ChainSource : Source
{
    Source & first;
    Source & second;

    ChainSource(Source & first, Source & second)
        : first(first)
        , second(second)
    {
    }

    size_t read(char * data, size_t len) override;

private:
    bool firstDone = false;
};

/**
 * Fixed-width integers and short strings in network byte order, as
 * written by the remote cache protocol.
 *
 * A short string is a 16-bit big-endian byte count followed by the
 * bytes themselves, so it cannot exceed 65535 bytes.
 */
void writeInt32(Sink & sink, int32_t n);

int32_t readInt32(Source & source);

void writeShortString(Sink & sink, std::string_view s);

std::string readShortString(Source & source);

/**
 * Read exactly `len` bytes.
 */
std::string readBytes(Source & source, size_t len);

} // namespace artcache

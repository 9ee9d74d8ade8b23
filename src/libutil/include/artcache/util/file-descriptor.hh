#pragma once
///@file

#include "artcache/util/types.hh"

#include <string_view>

namespace artcache {

typedef int Descriptor;

const Descriptor INVALID_DESCRIPTOR = -1;

/**
 * Write all of `s` to a file descriptor.
 */
void writeFull(Descriptor fd, std::string_view s);

static inline Descriptor getStandardError()
{
    return 2;
}

static inline Descriptor getStandardOutput()
{
    return 1;
}

class AutoCloseFD
{
    Descriptor fd;
public:
    AutoCloseFD();
    AutoCloseFD(Descriptor fd);
    AutoCloseFD(const AutoCloseFD & fd) = delete;
    AutoCloseFD(AutoCloseFD && fd) noexcept;
    ~AutoCloseFD();
    AutoCloseFD & operator=(const AutoCloseFD & fd) = delete;
    AutoCloseFD & operator=(AutoCloseFD && fd);
    Descriptor get() const;
    explicit operator bool() const;
    Descriptor release();
    void close();

    /**
     * Perform a blocking fsync operation.
     */
    void fsync() const;
};

} // namespace artcache

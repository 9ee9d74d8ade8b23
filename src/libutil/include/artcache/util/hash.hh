#pragma once
///@file

#include "artcache/util/serialise.hh"

#include <cstdint>
#include <string>

namespace artcache {

/**
 * A CRC-32 (IEEE 802.3 polynomial) checksum, the integrity check of
 * the remote cache protocol.
 */
struct Crc32
{
    uint32_t value = 0;

    /**
     * The checksum as it appears on the wire: four bytes, least
     * significant first.
     */
    std::string toBytes() const;

    static Crc32 fromBytes(std::string_view bytes);

    std::string to_string() const;

    bool operator==(const Crc32 &) const = default;
};

Crc32 crc32(std::string_view data);

/**
 * A sink that computes the CRC-32 of the data written to it.
 */
class Crc32Sink : public Sink
{
private:
    uint32_t state;
    uint64_t bytes = 0;

public:
    Crc32Sink();

    void operator()(std::string_view data) override;

    /**
     * The checksum of all data so far, and the number of bytes it
     * covers. The sink may continue to be used.
     */
    std::pair<Crc32, uint64_t> currentHash() const;
};

} // namespace artcache

#include "artcache/util/hash.hh"
#include "artcache/util/error.hh"

#include <zlib.h>

#include <iomanip>
#include <sstream>

namespace artcache {

/* zlib takes lengths as uInt, so large inputs are fed in pieces. */
static uint32_t updateCrc32(uint32_t crc, std::string_view data)
{
    while (!data.empty()) {
        auto n = std::min<size_t>(data.size(), 1U << 30);
        crc = ::crc32(crc, reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(n));
        data.remove_prefix(n);
    }
    return crc;
}

std::string Crc32::toBytes() const
{
    std::string s(4, 0);
    for (int i = 0; i < 4; ++i)
        s[i] = static_cast<char>((value >> (8 * i)) & 0xff);
    return s;
}

Crc32 Crc32::fromBytes(std::string_view bytes)
{
    if (bytes.size() != 4)
        throw Error("CRC-32 checksum must be 4 bytes, got %d", bytes.size());
    Crc32 res;
    for (int i = 0; i < 4; ++i)
        res.value |= uint32_t(static_cast<unsigned char>(bytes[i])) << (8 * i);
    return res;
}

std::string Crc32::to_string() const
{
    std::ostringstream str;
    str << std::hex << std::setw(8) << std::setfill('0') << value;
    return str.str();
}

Crc32 crc32(std::string_view data)
{
    return Crc32{updateCrc32(::crc32(0L, Z_NULL, 0), data)};
}

Crc32Sink::Crc32Sink()
    : state(::crc32(0L, Z_NULL, 0))
{
}

void Crc32Sink::operator()(std::string_view data)
{
    bytes += data.size();
    state = updateCrc32(state, data);
}

std::pair<Crc32, uint64_t> Crc32Sink::currentHash() const
{
    return {Crc32{state}, bytes};
}

} // namespace artcache

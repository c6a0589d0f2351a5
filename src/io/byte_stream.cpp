#include "io/byte_stream.hpp"

#include <stdexcept>

namespace pchunk {

uint32_t read_u32_be_at(const uint8_t* data, size_t size, size_t off) {
    if (!data && size != 0) throw std::runtime_error("bytestream: read_u32_be_at null data");
    if (off > size || size - off < 4) {
        throw DecodeError(DecodeErrorKind::Truncated, "bytestream: premature EOF (u32)");
    }
    return (static_cast<uint32_t>(data[off]) << 24) |
           (static_cast<uint32_t>(data[off + 1]) << 16) |
           (static_cast<uint32_t>(data[off + 2]) << 8) |
           static_cast<uint32_t>(data[off + 3]);
}

void put_u32_be_at(std::vector<uint8_t>& buf, size_t off, uint32_t v) {
    if (off > buf.size() || buf.size() - off < 4) {
        throw std::runtime_error("bytestream: put_u32_be_at out of range");
    }
    buf[off]     = static_cast<uint8_t>((v >> 24) & 0xFF);
    buf[off + 1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    buf[off + 2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    buf[off + 3] = static_cast<uint8_t>(v & 0xFF);
}

} // namespace pchunk

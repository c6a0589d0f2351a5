#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pchunk {

// CRC-32, ISO-HDLC parameters (poly 0x04C11DB7 reflected, init/xorout 0xFFFFFFFF),
// the one used by PNG and zlib. Backed by zlib's crc32().
class Crc32 {
public:
    Crc32();
    Crc32& update(const uint8_t* data, size_t n);
    Crc32& update(const std::vector<uint8_t>& data) { return update(data.data(), data.size()); }
    uint32_t value() const { return crc_; }
    void reset();
private:
    uint32_t crc_;
};

uint32_t crc32_of(const uint8_t* data, size_t n);
uint32_t crc32_of(const std::vector<uint8_t>& data);

} // namespace pchunk

#include "checksum/crc32.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace pchunk {

Crc32::Crc32() : crc_(static_cast<uint32_t>(::crc32(0L, Z_NULL, 0))) {}

Crc32& Crc32::update(const uint8_t* data, size_t n) {
    if (!data && n != 0) throw std::runtime_error("crc32: update null data");
    // zlib takes uInt lengths; feed larger buffers in pieces.
    const size_t max_step = std::numeric_limits<uInt>::max();
    while (n > 0) {
        const size_t step = std::min(n, max_step);
        crc_ = static_cast<uint32_t>(::crc32(crc_, data, static_cast<uInt>(step)));
        data += step;
        n -= step;
    }
    return *this;
}

void Crc32::reset() {
    crc_ = static_cast<uint32_t>(::crc32(0L, Z_NULL, 0));
}

uint32_t crc32_of(const uint8_t* data, size_t n) {
    return Crc32().update(data, n).value();
}

uint32_t crc32_of(const std::vector<uint8_t>& data) {
    return crc32_of(data.data(), data.size());
}

// Debug self-test: standard check value for "123456789".
#ifndef NDEBUG
namespace {
struct Crc32SelfTest {
    Crc32SelfTest() {
        static const uint8_t check[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
        if (crc32_of(check, sizeof(check)) != 0xCBF43926u) {
            throw std::runtime_error("crc32 self-test: check value mismatch");
        }
        Crc32 split;
        split.update(check, 4).update(check + 4, 5);
        if (split.value() != 0xCBF43926u) {
            throw std::runtime_error("crc32 self-test: incremental mismatch");
        }
    }
};
static Crc32SelfTest _crc32_self_test{};
} // namespace
#endif

} // namespace pchunk

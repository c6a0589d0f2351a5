#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "format/chunk_format.hpp"

namespace pchunk {

// 4-byte chunk type identifier, e.g. "IHDR" or "RuSt".
//
// Bit 5 (0x20) of each byte is a property flag:
//   byte 0  clear = critical        set = ancillary
//   byte 1  clear = public          set = private
//   byte 2  clear = reserved valid  set = invalid
//   byte 3  clear = unsafe to copy  set = safe to copy
// For ASCII letters that bit is the lowercase bit.
class TypeTag {
public:
    using Bytes = std::array<uint8_t, kTypeTagBytes>;

    // Unchecked: any 4 bytes are accepted.
    static TypeTag from_bytes(const Bytes& bytes);
    // Throws InvalidTag unless s is exactly 4 ASCII letters.
    static TypeTag from_ascii(const std::string& s);

    const Bytes& to_bytes() const { return bytes_; }
    // Byte-for-byte; no validation, may contain control characters.
    std::string to_ascii_string() const;

    bool is_critical() const;
    bool is_public() const;
    bool is_reserved_bit_valid() const;
    bool is_safe_to_copy() const;
    bool is_valid() const { return is_reserved_bit_valid(); }

    bool operator==(const TypeTag& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const TypeTag& o) const { return bytes_ != o.bytes_; }

private:
    explicit TypeTag(const Bytes& bytes) : bytes_(bytes) {}
    bool property_bit(size_t index) const;

    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const TypeTag& tag);

} // namespace pchunk

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace pchunk {

// Chunk record layout:
// [length][type tag][payload...][checksum]
//
// length and checksum are big-endian (network order).
// The type tag is copied verbatim, never byte-swapped.
// checksum = CRC-32 (ISO-HDLC, same as zlib/PNG) over type tag ++ payload.
//
// Do NOT serialize a struct with memcpy; always write field-by-field.
inline constexpr size_t kLengthFieldBytes   = 4;
inline constexpr size_t kTypeTagBytes       = 4;
inline constexpr size_t kChecksumFieldBytes = 4;

inline constexpr size_t kLengthOffset  = 0;
inline constexpr size_t kTypeTagOffset = kLengthOffset + kLengthFieldBytes;   // 4
inline constexpr size_t kPayloadOffset = kTypeTagOffset + kTypeTagBytes;      // 8

// length + type tag + checksum, i.e. the size of an empty chunk.
inline constexpr size_t kChunkOverheadBytes =
    kLengthFieldBytes + kTypeTagBytes + kChecksumFieldBytes;                  // 12

// The length field is a u32; larger payloads cannot be represented.
inline constexpr uint64_t kMaxPayloadBytes = std::numeric_limits<uint32_t>::max();

// Bit 5 of each type tag byte carries one property flag.
inline constexpr uint8_t kTypeTagPropertyBit = 0x20;

} // namespace pchunk

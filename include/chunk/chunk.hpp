#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "chunk/type_tag.hpp"

namespace pchunk {

// One length-prefixed, type-tagged, CRC-checked record (see format/chunk_format.hpp).
// Immutable: length and checksum are derived from the tag and payload.
class Chunk {
public:
    // Throws std::length_error if payload does not fit the u32 length field.
    Chunk(TypeTag type_tag, std::vector<uint8_t> payload);

    // Parse one record from the front of a buffer; bytes past 12 + length are ignored.
    // Throws DecodeError (Truncated / ChecksumMismatch).
    // The type tag is not validated; check type_tag().is_valid() if it matters.
    static Chunk from_bytes(const uint8_t* data, size_t size);
    static Chunk from_bytes(const std::vector<uint8_t>& bytes);

    uint32_t length() const { return length_; }
    const TypeTag& type_tag() const { return type_tag_; }
    const std::vector<uint8_t>& payload() const { return payload_; }
    uint32_t checksum() const { return checksum_; }

    // 12 + length
    size_t encoded_size() const;

    // Throws TextError if the payload is not valid UTF-8.
    std::string payload_as_text() const;

    std::vector<uint8_t> to_bytes() const;

    // length, tag, payload text and checksum run together. Debug only.
    // Throws TextError if the payload is not valid UTF-8.
    std::string to_display_string() const;

    bool operator==(const Chunk& o) const;
    bool operator!=(const Chunk& o) const { return !(*this == o); }

private:
    uint32_t length_;
    TypeTag type_tag_;
    std::vector<uint8_t> payload_;
    uint32_t checksum_;
};

// Writes to_display_string(); throws TextError on non-UTF-8 payloads.
std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

// CRC-32 over tag bytes followed by payload.
uint32_t chunk_checksum(const TypeTag& type_tag, const uint8_t* payload, size_t n);

} // namespace pchunk

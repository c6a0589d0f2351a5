#include "chunk/chunk.hpp"

#include "checksum/crc32.hpp"
#include "format/chunk_format.hpp"
#include "format/errors.hpp"
#include "io/byte_stream.hpp"
#include "text/utf8.hpp"

#include <ostream>
#include <stdexcept>
#include <utility>

namespace pchunk {

uint32_t chunk_checksum(const TypeTag& type_tag, const uint8_t* payload, size_t n) {
    const TypeTag::Bytes& tag = type_tag.to_bytes();
    return Crc32().update(tag.data(), tag.size()).update(payload, n).value();
}

namespace {
uint32_t checked_length(const std::vector<uint8_t>& payload) {
    if (static_cast<uint64_t>(payload.size()) > kMaxPayloadBytes) {
        throw std::length_error("chunk: payload of " + std::to_string(payload.size()) +
                                " bytes exceeds the u32 length field");
    }
    return static_cast<uint32_t>(payload.size());
}
} // namespace

Chunk::Chunk(TypeTag type_tag, std::vector<uint8_t> payload)
    : length_(checked_length(payload)),
      type_tag_(type_tag),
      payload_(std::move(payload)),
      checksum_(chunk_checksum(type_tag_, payload_.data(), payload_.size())) {}

Chunk Chunk::from_bytes(const uint8_t* data, size_t size) {
    if (!data && size != 0) throw std::runtime_error("decode: null data");
    if (size < kChunkOverheadBytes) {
        throw DecodeError(DecodeErrorKind::Truncated,
                          "decode: " + std::to_string(size) + " bytes is smaller than a chunk header");
    }

    ByteReader r(data, size);
    const uint32_t length = r.read_u32_be();

    TypeTag::Bytes tag_bytes{};
    r.read_bytes(tag_bytes.data(), tag_bytes.size());
    const TypeTag type_tag = TypeTag::from_bytes(tag_bytes);

    const uint64_t needed = static_cast<uint64_t>(kChunkOverheadBytes) + length;
    if (static_cast<uint64_t>(size) < needed) {
        throw DecodeError(DecodeErrorKind::Truncated,
                          "decode: declared length " + std::to_string(length) + " needs " +
                          std::to_string(needed) + " bytes, buffer has " + std::to_string(size));
    }

    std::vector<uint8_t> payload = r.read_vector(length);
    const uint32_t declared_crc = r.read_u32_be();

    Chunk chunk(type_tag, std::move(payload));
    if (chunk.length() != length || chunk.checksum() != declared_crc) {
        throw DecodeError(DecodeErrorKind::ChecksumMismatch,
                          "decode: checksum mismatch for chunk '" + type_tag.to_ascii_string() +
                          "' (stored " + std::to_string(declared_crc) + ", computed " +
                          std::to_string(chunk.checksum()) + ")");
    }
    return chunk;
}

Chunk Chunk::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_bytes(bytes.data(), bytes.size());
}

size_t Chunk::encoded_size() const {
    return kChunkOverheadBytes + static_cast<size_t>(length_);
}

std::string Chunk::payload_as_text() const {
    uint32_t bad_off = 0;
    if (!validate_utf8_strict(payload_.data(), payload_.size(), bad_off)) {
        throw TextError(TextErrorKind::InvalidEncoding, bad_off,
                        "chunk: payload is not valid UTF-8 (offset " + std::to_string(bad_off) + ")");
    }
    return std::string(payload_.begin(), payload_.end());
}

std::vector<uint8_t> Chunk::to_bytes() const {
    const TypeTag::Bytes& tag = type_tag_.to_bytes();

    ByteWriter w;
    w.reserve(encoded_size());
    w.write_u32_be(length_);
    w.write_bytes(tag.data(), tag.size());
    w.write_bytes(payload_.data(), payload_.size());
    w.write_u32_be(checksum_);

    std::vector<uint8_t> bytes = w.release();
    if (bytes.size() != encoded_size()) {
        throw std::runtime_error("encode: buffer size mismatch");
    }
    return bytes;
}

std::string Chunk::to_display_string() const {
    return std::to_string(length_) + type_tag_.to_ascii_string() + payload_as_text() +
           std::to_string(checksum_);
}

bool Chunk::operator==(const Chunk& o) const {
    return length_ == o.length_ && type_tag_ == o.type_tag_ &&
           checksum_ == o.checksum_ && payload_ == o.payload_;
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    return os << chunk.to_display_string();
}

} // namespace pchunk

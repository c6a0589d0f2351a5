#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pchunk {

enum class InvalidTagKind : uint8_t {
    WrongLength   = 1,  // ASCII input is not exactly 4 bytes
    NonAlphabetic = 2,  // a byte outside A-Z / a-z
};

enum class DecodeErrorKind : uint8_t {
    Truncated        = 1,  // buffer shorter than the fields require
    ChecksumMismatch = 2,  // embedded CRC (or length) disagrees with contents
};

enum class TextErrorKind : uint8_t {
    InvalidEncoding = 1,   // payload is not valid UTF-8
};

// Raised by TypeTag::from_ascii.
class InvalidTag : public std::runtime_error {
public:
    InvalidTag(InvalidTagKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    InvalidTagKind kind() const { return kind_; }
private:
    InvalidTagKind kind_;
};

// Raised by Chunk::from_bytes and ByteReader.
class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    DecodeErrorKind kind() const { return kind_; }
private:
    DecodeErrorKind kind_;
};

// Raised when a payload is read as text.
// bad_offset() is the offset of the first byte of the offending sequence.
class TextError : public std::runtime_error {
public:
    TextError(TextErrorKind kind, uint32_t bad_offset, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), bad_offset_(bad_offset) {}
    TextErrorKind kind() const { return kind_; }
    uint32_t bad_offset() const { return bad_offset_; }
private:
    TextErrorKind kind_;
    uint32_t bad_offset_;
};

} // namespace pchunk

#include "chunk/type_tag.hpp"

#include "format/errors.hpp"

#include <ostream>
#include <stdexcept>

namespace pchunk {

namespace {
inline bool is_ascii_alpha(uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}
} // namespace

TypeTag TypeTag::from_bytes(const Bytes& bytes) {
    return TypeTag(bytes);
}

TypeTag TypeTag::from_ascii(const std::string& s) {
    if (s.size() != kTypeTagBytes) {
        throw InvalidTag(InvalidTagKind::WrongLength,
                         "type tag: expected 4 bytes, got " + std::to_string(s.size()));
    }
    Bytes bytes{};
    for (size_t i = 0; i < kTypeTagBytes; ++i) {
        const uint8_t c = static_cast<uint8_t>(s[i]);
        if (!is_ascii_alpha(c)) {
            throw InvalidTag(InvalidTagKind::NonAlphabetic,
                             "type tag: non-alphabetic byte at index " + std::to_string(i));
        }
        bytes[i] = c;
    }
    return TypeTag(bytes);
}

std::string TypeTag::to_ascii_string() const {
    std::string s;
    s.reserve(kTypeTagBytes);
    for (uint8_t b : bytes_) s.push_back(static_cast<char>(b));
    return s;
}

bool TypeTag::property_bit(size_t index) const {
    return (bytes_[index] & kTypeTagPropertyBit) != 0;
}

bool TypeTag::is_critical() const { return !property_bit(0); }
bool TypeTag::is_public() const { return !property_bit(1); }
bool TypeTag::is_reserved_bit_valid() const { return !property_bit(2); }
bool TypeTag::is_safe_to_copy() const { return property_bit(3); }

std::ostream& operator<<(std::ostream& os, const TypeTag& tag) {
    return os << tag.to_ascii_string();
}

// Debug self-test: "bLOb" is ancillary, public, reserved-valid and safe to copy.
#ifndef NDEBUG
namespace {
struct TypeTagSelfTest {
    TypeTagSelfTest() {
        const TypeTag t = TypeTag::from_bytes({'b', 'L', 'O', 'b'});
        if (t.is_critical() || !t.is_public() || !t.is_reserved_bit_valid() || !t.is_safe_to_copy()) {
            throw std::runtime_error("type tag self-test: flag mismatch");
        }
        if (t.to_ascii_string() != "bLOb") {
            throw std::runtime_error("type tag self-test: ascii round-trip mismatch");
        }
    }
};
static TypeTagSelfTest _type_tag_self_test{};
} // namespace
#endif

} // namespace pchunk

#pragma once

#include <cstddef>
#include <cstdint>

namespace pchunk {

// Strict UTF-8 validator (rejects overlongs, surrogates and code points > U+10FFFF).
// Returns false and sets bad_off when an invalid byte sequence is found.
bool validate_utf8_strict(const uint8_t* data, size_t n, uint32_t& bad_off);

} // namespace pchunk

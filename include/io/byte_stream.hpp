#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include "format/errors.hpp"

namespace pchunk {

class ByteWriter {
public:
    void reserve(size_t n) { buf_.reserve(n); }
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_be(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    void write_u32_be(uint32_t v) {
        write_u16_be(static_cast<uint16_t>((v >> 16) & 0xFFFF));
        write_u16_be(static_cast<uint16_t>(v & 0xFFFF));
    }
    void write_bytes(const void* p, size_t n) {
        if (n == 0) return;
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> release() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

// Non-owning cursor over a caller's buffer. The buffer must outlive the reader.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data)
        : data_(data.data()), size_(data.size()) {}

    uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }
    uint16_t read_u16_be() {
        uint16_t hi = read_u8();
        uint16_t lo = read_u8();
        return static_cast<uint16_t>((hi << 8) | lo);
    }
    uint32_t read_u32_be() {
        uint32_t hi = read_u16_be();
        uint32_t lo = read_u16_be();
        return (hi << 16) | lo;
    }
    void read_bytes(void* out, size_t n) {
        need(n);
        if (n == 0) return;
        std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }
    std::vector<uint8_t> read_vector(size_t n) {
        std::vector<uint8_t> out(n);
        read_bytes(out.data(), n);
        return out;
    }
    bool eof() const { return pos_ >= size_; }
    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }
private:
    void need(size_t n) const {
        if (n > size_ - pos_) {
            throw DecodeError(DecodeErrorKind::Truncated, "bytestream: premature EOF");
        }
    }
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

// Random access helpers for fixed-offset fields.
uint32_t read_u32_be_at(const uint8_t* data, size_t size, size_t off);
void put_u32_be_at(std::vector<uint8_t>& buf, size_t off, uint32_t v);

} // namespace pchunk

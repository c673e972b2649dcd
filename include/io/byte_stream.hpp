#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rgb0 {

// All multi-byte fields of the capture format are big-endian.
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
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    void write_zeros(size_t n) { buf_.insert(buf_.end(), n, 0); }
    size_t size() const { return buf_.size(); }
    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data.data()), size_(data.size()) {}
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

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
        std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }
    void skip(size_t n) {
        need(n);
        pos_ += n;
    }
    bool eof() const { return pos_ >= size_; }
    size_t remaining() const { return size_ - pos_; }
    size_t position() const { return pos_; }
private:
    void need(size_t n) {
        if (n > size_ - pos_) throw std::runtime_error("byte_stream: premature EOF");
    }
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace rgb0

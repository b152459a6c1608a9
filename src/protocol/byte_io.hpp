#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/varint.hpp"

namespace parley {

// Non-owning view of a byte range.
struct ByteRange {
    const uint8_t* data = nullptr;
    size_t size = 0;

    bool empty() const { return size == 0; }
    std::vector<uint8_t> to_vector() const {
        return std::vector<uint8_t>(data, data + size);
    }
};

// Append little-endian integers to a buffer.
void put_u16(std::vector<uint8_t>& buf, uint16_t v);
void put_u64(std::vector<uint8_t>& buf, uint64_t v);
void put_i64(std::vector<uint8_t>& buf, int64_t v);
void put_varint(std::vector<uint8_t>& buf, uint64_t v);
void put_bytes(std::vector<uint8_t>& buf, const uint8_t* data, size_t n);

// Bounds-checked little-endian cursor over a byte range.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size)
        : data_(data), size_(size), pos_(0) {}
    explicit ByteReader(ByteRange r) : ByteReader(r.data, r.size) {}

    bool has(size_t n) const { return n <= size_ - pos_; }
    size_t remaining() const { return size_ - pos_; }
    size_t position() const { return pos_; }
    bool empty() const { return pos_ == size_; }

    bool get_u16(uint16_t& v);
    bool get_u64(uint64_t& v);
    bool get_i64(int64_t& v);
    VarintStatus get_varint(uint64_t& v);

    // Take the next n bytes as a sub-range.
    bool take(size_t n, ByteRange& out);

    // Everything not yet consumed.
    ByteRange rest() const { return ByteRange{data_ + pos_, size_ - pos_}; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

} // namespace parley

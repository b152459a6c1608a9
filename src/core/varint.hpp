#pragma once

#include <cstdint>
#include <cstddef>

namespace parley {

enum class VarintStatus : uint8_t {
    kOk = 0,
    kTruncated,   // buffer ended before the final group
    kOverflow,    // value does not fit into 64 bits
};

// Maximum encoded size of a uint64_t in LEB128.
inline constexpr size_t VARINT_MAX_BYTES = 10;

// Encode a uint64_t as LEB128 into buf. Returns number of bytes written.
// buf must have room for VARINT_MAX_BYTES.
inline size_t varint_encode(uint64_t value, uint8_t* buf) {
    size_t n = 0;
    do {
        uint8_t byte = value & 0x7F;
        value >>= 7;
        if (value != 0)
            byte |= 0x80;
        buf[n++] = byte;
    } while (value != 0);
    return n;
}

// Decode a LEB128 uint64_t from [buf, buf + size).
// On kOk, value and consumed are set.
inline VarintStatus varint_decode(const uint8_t* buf, size_t size,
                                  uint64_t& value, size_t& consumed) {
    value = 0;
    consumed = 0;
    unsigned shift = 0;
    while (true) {
        if (consumed >= size) return VarintStatus::kTruncated;
        uint8_t byte = buf[consumed++];
        uint64_t group = byte & 0x7F;
        if (shift > 63) return VarintStatus::kOverflow;
        if (shift == 63 && group > 1) return VarintStatus::kOverflow;
        value |= group << shift;
        if (!(byte & 0x80)) return VarintStatus::kOk;
        shift += 7;
    }
}

// Compute encoded size of a uint64_t in LEB128 without writing.
inline size_t varint_size(uint64_t value) {
    size_t n = 1;
    while (value >= 0x80) {
        value >>= 7;
        n++;
    }
    return n;
}

} // namespace parley

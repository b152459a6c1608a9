#include "protocol/byte_io.hpp"

namespace parley {

void put_u16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v));
    buf.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u64(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        buf.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

void put_i64(std::vector<uint8_t>& buf, int64_t v) {
    put_u64(buf, static_cast<uint64_t>(v));
}

void put_varint(std::vector<uint8_t>& buf, uint64_t v) {
    uint8_t tmp[VARINT_MAX_BYTES];
    size_t n = varint_encode(v, tmp);
    buf.insert(buf.end(), tmp, tmp + n);
}

void put_bytes(std::vector<uint8_t>& buf, const uint8_t* data, size_t n) {
    buf.insert(buf.end(), data, data + n);
}

bool ByteReader::get_u16(uint16_t& v) {
    if (!has(2)) return false;
    v = static_cast<uint16_t>(data_[pos_]) |
        (static_cast<uint16_t>(data_[pos_ + 1]) << 8);
    pos_ += 2;
    return true;
}

bool ByteReader::get_u64(uint64_t& v) {
    if (!has(8)) return false;
    v = 0;
    for (int i = 0; i < 8; i++) {
        v |= static_cast<uint64_t>(data_[pos_ + i]) << (i * 8);
    }
    pos_ += 8;
    return true;
}

bool ByteReader::get_i64(int64_t& v) {
    uint64_t u;
    if (!get_u64(u)) return false;
    v = static_cast<int64_t>(u);
    return true;
}

VarintStatus ByteReader::get_varint(uint64_t& v) {
    size_t consumed = 0;
    VarintStatus st = varint_decode(data_ + pos_, size_ - pos_, v, consumed);
    if (st == VarintStatus::kOk) pos_ += consumed;
    return st;
}

bool ByteReader::take(size_t n, ByteRange& out) {
    if (!has(n)) return false;
    out = ByteRange{data_ + pos_, n};
    pos_ += n;
    return true;
}

} // namespace parley

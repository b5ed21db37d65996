#include "serialize.hpp"
#include "error.hpp"

namespace cosign {

void write_u8(std::vector<uint8_t>& out, uint8_t value) {
    out.push_back(value);
}

void write_le32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void write_le64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

// CompactSize encoding:
// - < 0xfd       : 1 byte
// - <= 0xffff    : 0xfd + 2 bytes
// - <= 0xffffffff: 0xfe + 4 bytes
// - otherwise    : 0xff + 8 bytes
void write_compact_size(std::vector<uint8_t>& out, uint64_t value) {
    if (value < 0xfd) {
        out.push_back(static_cast<uint8_t>(value));
    } else if (value <= 0xffff) {
        out.push_back(0xfd);
        out.push_back(static_cast<uint8_t>(value));
        out.push_back(static_cast<uint8_t>(value >> 8));
    } else if (value <= 0xffffffff) {
        out.push_back(0xfe);
        write_le32(out, static_cast<uint32_t>(value));
    } else {
        out.push_back(0xff);
        write_le64(out, value);
    }
}

void write_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void write_var_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    write_compact_size(out, bytes.size());
    write_bytes(out, bytes);
}

size_t compact_size_length(uint64_t value) {
    if (value < 0xfd) return 1;
    if (value <= 0xffff) return 3;
    if (value <= 0xffffffff) return 5;
    return 9;
}

void ByteReader::require(size_t count) const {
    if (count > data_.size() - pos_) {
        throw CosignError(CosignError::ErrorType::Encoding, "Unexpected end of data");
    }
}

uint8_t ByteReader::read_u8() {
    require(1);
    return data_[pos_++];
}

uint32_t ByteReader::read_le32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data_[pos_++]) << (8 * i);
    }
    return value;
}

uint64_t ByteReader::read_le64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data_[pos_++]) << (8 * i);
    }
    return value;
}

uint64_t ByteReader::read_compact_size() {
    uint8_t first = read_u8();
    if (first < 0xfd) {
        return first;
    }
    if (first == 0xfd) {
        require(2);
        uint64_t value = data_[pos_] | (static_cast<uint64_t>(data_[pos_ + 1]) << 8);
        pos_ += 2;
        return value;
    }
    if (first == 0xfe) {
        return read_le32();
    }
    return read_le64();
}

std::vector<uint8_t> ByteReader::read_bytes(size_t count) {
    require(count);
    std::vector<uint8_t> bytes(data_.begin() + pos_, data_.begin() + pos_ + count);
    pos_ += count;
    return bytes;
}

std::vector<uint8_t> ByteReader::read_var_bytes() {
    uint64_t length = read_compact_size();
    if (length > data_.size() - pos_) {
        throw CosignError(CosignError::ErrorType::Encoding, "Length prefix exceeds data");
    }
    return read_bytes(static_cast<size_t>(length));
}

} // namespace cosign

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace cosign {

// Little-endian and CompactSize helpers for the Bitcoin wire format
// https://en.bitcoin.it/wiki/Protocol_documentation#Variable_length_integer

void write_u8(std::vector<uint8_t>& out, uint8_t value);
void write_le32(std::vector<uint8_t>& out, uint32_t value);
void write_le64(std::vector<uint8_t>& out, uint64_t value);
void write_compact_size(std::vector<uint8_t>& out, uint64_t value);
void write_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes);

// CompactSize length prefix followed by the bytes
void write_var_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes);

size_t compact_size_length(uint64_t value);

// Sequential reader over a byte buffer. Every read past the end throws an
// EncodingError, so parsers never index out of bounds.
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    uint8_t read_u8();
    uint32_t read_le32();
    uint64_t read_le64();
    uint64_t read_compact_size();
    std::vector<uint8_t> read_bytes(size_t count);
    std::vector<uint8_t> read_var_bytes();

    bool empty() const { return pos_ >= data_.size(); }
    size_t position() const { return pos_; }

private:
    void require(size_t count) const;

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace cosign

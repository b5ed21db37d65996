#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace cosign {

// Base58 is a utility class for Base58 encoding and decoding.
//
// Base58 is a binary-to-text encoding scheme primarily used in Bitcoin addresses
// and other cryptocurrency systems. It uses a 58-character alphabet consisting of
// easily distinguishable characters (excluding 0, O, I, l) to represent data.
// Wallet and transaction fingerprints are Base58 strings as well, which keeps
// them short and URL-safe.
class Base58 {
public:
    // Encodes raw bytes, no checksum
    static std::string encode(std::span<const uint8_t> data);

    // Decodes a Base58 string into raw bytes, no checksum handling
    static std::vector<uint8_t> decode(std::string_view encoded);

    // Appends the 4-byte double-SHA256 checksum and encodes
    static std::string encode_check(std::span<const uint8_t> payload);

    // Decodes and verifies the 4-byte checksum, returning the payload
    static std::vector<uint8_t> decode_check(std::string_view encoded);

private:
    // Private constructor to prevent instantiation
    Base58() = delete;
};

} // namespace cosign

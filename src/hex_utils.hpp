#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"

namespace cosign {

class HexUtils {
public:
    // Convert a hexadecimal string to a byte vector
    static std::vector<uint8_t> decode(std::string_view hex) {
        if (hex.length() % 2 != 0) {
            throw CosignError(CosignError::ErrorType::Encoding, "Invalid hex string length");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.length() / 2);

        for (size_t i = 0; i < hex.length(); i += 2) {
            int hi = nibble(hex[i]);
            int lo = nibble(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                throw CosignError(CosignError::ErrorType::Encoding, "Invalid hex character");
            }
            bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }

        return bytes;
    }

    // Convert a byte sequence to a lowercase hexadecimal string
    static std::string encode(std::span<const uint8_t> data) {
        std::string result;
        result.reserve(data.size() * 2);

        static const char hex_chars[] = "0123456789abcdef";
        for (uint8_t byte : data) {
            result.push_back(hex_chars[byte >> 4]);
            result.push_back(hex_chars[byte & 0x0F]);
        }

        return result;
    }

    static bool is_hex(std::string_view hex) {
        if (hex.length() % 2 != 0) {
            return false;
        }
        for (char c : hex) {
            if (nibble(c) < 0) {
                return false;
            }
        }
        return true;
    }

private:
    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace cosign
